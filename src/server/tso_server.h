#ifndef MERIDIAN_SERVER_TSO_SERVER_H_
#define MERIDIAN_SERVER_TSO_SERVER_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "absl/status/status.h"

#include "common/clock.h"
#include "common/configuration.h"
#include "election/election.h"
#include "election/leadership_guard.h"
#include "storage/checkpoint_store.h"
#include "tso/allocator_manager.h"
#include "tso_service.h"

namespace Meridian {

/**
 * Standalone timestamp oracle server: checkpoint store from backend_endpoints,
 * a self-driven election, the allocator manager and the gRPC service on
 * listen_addr.
 */
class TsoServer {
	public:
		explicit TsoServer(const MeridianConfig& config);
		~TsoServer();

		const std::string& Name() const { return name_; }

		/// Brings everything up and campaigns. Returns once the gRPC server is listening.
		absl::Status Run();

		/// Blocks until Close() shuts the gRPC server down
		void Wait();

		void Close();

		/// Runs after the server started listening
		void AddStartCallback(std::function<void()> callback);

		/// Runs each time this server becomes leader, after the allocators were initialized
		void AddLeaderCallback(std::function<void(uint64_t)> callback);

		AllocatorManager* manager() { return manager_.get(); }

	private:
		absl::Status BuildCredentials(std::shared_ptr<grpc::ServerCredentials>* credentials) const;

		const MeridianConfig& config_;
		const std::string name_;

		SystemClock clock_;
		std::unique_ptr<CheckpointStore> store_;
		LocalElection election_;
		LeadershipGuard guard_;
		std::unique_ptr<AllocatorManager> manager_;
		std::unique_ptr<TimestampOracleServiceImpl> service_;
		std::unique_ptr<grpc::Server> server_;

		std::vector<std::function<void()>> start_callbacks_;
		std::vector<std::function<void(uint64_t)>> leader_callbacks_;
		bool closed_ = false;
};

} // namespace Meridian

#endif // MERIDIAN_SERVER_TSO_SERVER_H_
