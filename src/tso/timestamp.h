#ifndef MERIDIAN_TSO_TIMESTAMP_H_
#define MERIDIAN_TSO_TIMESTAMP_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace Meridian {

/// Number of bits reserved for the logical counter in a composed timestamp
inline constexpr int kLogicalBits = 18;
/// Logical values per physical millisecond; the counter never reaches it
inline constexpr int64_t kMaxLogical = int64_t{1} << kLogicalBits;

/**
 * (physical milliseconds, logical counter) pair. Ordered by physical, then logical.
 */
struct Timestamp {
	int64_t physical = 0;
	int64_t logical = 0;

	bool IsZero() const { return physical == 0 && logical == 0; }

	/// Timestamp `n` positions later within the same physical millisecond
	Timestamp Next(int64_t n = 1) const { return Timestamp{physical, logical + n}; }

	std::string ToString() const {
		return "(" + std::to_string(physical) + ", " + std::to_string(logical) + ")";
	}
};

inline bool operator==(const Timestamp& a, const Timestamp& b) {
	return a.physical == b.physical && a.logical == b.logical;
}
inline bool operator!=(const Timestamp& a, const Timestamp& b) { return !(a == b); }
inline bool operator<(const Timestamp& a, const Timestamp& b) {
	return std::tie(a.physical, a.logical) < std::tie(b.physical, b.logical);
}
inline bool operator>(const Timestamp& a, const Timestamp& b) { return b < a; }
inline bool operator<=(const Timestamp& a, const Timestamp& b) { return !(b < a); }
inline bool operator>=(const Timestamp& a, const Timestamp& b) { return !(a < b); }

inline std::ostream& operator<<(std::ostream& os, const Timestamp& ts) {
	return os << ts.ToString();
}

/// Packs a timestamp into a single 64-bit value: physical << 18 | logical
inline uint64_t ComposeTs(const Timestamp& ts) {
	return (static_cast<uint64_t>(ts.physical) << kLogicalBits) | static_cast<uint64_t>(ts.logical);
}

inline Timestamp ParseTs(uint64_t composed) {
	return Timestamp{static_cast<int64_t>(composed >> kLogicalBits),
	                 static_cast<int64_t>(composed & static_cast<uint64_t>(kMaxLogical - 1))};
}

} // namespace Meridian

#endif // MERIDIAN_TSO_TIMESTAMP_H_
