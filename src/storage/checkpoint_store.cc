#include "checkpoint_store.h"

#include <glog/logging.h>

#include "file_checkpoint_store.h"
#include "memory_checkpoint_store.h"

namespace Meridian {

namespace {
constexpr char kMemoryScheme[] = "memory://";
constexpr char kFileScheme[] = "file://";
}

absl::StatusOr<std::unique_ptr<CheckpointStore>> OpenCheckpointStore(const std::string& endpoint) {
	if (endpoint.rfind(kMemoryScheme, 0) == 0) {
		LOG(WARNING) << "Using in-memory checkpoint store; timestamps are not durable across restarts";
		return std::make_unique<MemoryCheckpointStore>();
	}
	if (endpoint.rfind(kFileScheme, 0) == 0) {
		auto store = std::make_unique<FileCheckpointStore>(endpoint.substr(sizeof(kFileScheme) - 1));
		absl::Status s = store->Open();
		if (!s.ok()) {
			return s;
		}
		return std::unique_ptr<CheckpointStore>(std::move(store));
	}
	return absl::InvalidArgumentError("unsupported backend endpoint: " + endpoint);
}

} // namespace Meridian
