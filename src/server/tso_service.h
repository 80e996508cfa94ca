#ifndef MERIDIAN_SERVER_TSO_SERVICE_H_
#define MERIDIAN_SERVER_TSO_SERVICE_H_

#include <grpcpp/grpcpp.h>
#include "absl/status/status.h"

#include <tso.grpc.pb.h>
#include "tso/allocator_manager.h"

namespace Meridian {

using grpc::ServerContext;
using meridian::tso::TimestampOracle;
using meridian::tso::TimestampRequest;
using meridian::tso::TimestampResponse;
using meridian::tso::ReadinessRequest;
using meridian::tso::ReadinessResponse;
using meridian::tso::ResetTimestampRequest;
using meridian::tso::ResetTimestampResponse;

/// NotLeader -> FAILED_PRECONDITION, Unavailable -> UNAVAILABLE,
/// InvalidArgument -> INVALID_ARGUMENT, Cancelled -> CANCELLED, else INTERNAL
grpc::Status ToGrpcStatus(const absl::Status& status);

class TimestampOracleServiceImpl final : public TimestampOracle::Service {
	public:
		explicit TimestampOracleServiceImpl(AllocatorManager* manager) : manager_(manager) {}

		grpc::Status GetTimestamp(ServerContext* context, const TimestampRequest* request,
				TimestampResponse* reply) override;

		grpc::Status GetReadiness(ServerContext* context, const ReadinessRequest* request,
				ReadinessResponse* reply) override;

		grpc::Status ResetTimestamp(ServerContext* context, const ResetTimestampRequest* request,
				ResetTimestampResponse* reply) override;

	private:
		AllocatorManager* manager_;
};

} // namespace Meridian

#endif // MERIDIAN_SERVER_TSO_SERVICE_H_
