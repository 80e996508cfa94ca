#include "tso_service.h"

#include <glog/logging.h>

#include "common/status.h"

namespace Meridian {

grpc::Status ToGrpcStatus(const absl::Status& status) {
	if (status.ok()) {
		return grpc::Status::OK;
	}
	const std::string message(status.message());
	if (IsNotLeader(status)) {
		return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, message);
	}
	switch (status.code()) {
		case absl::StatusCode::kUnavailable:
			return grpc::Status(grpc::StatusCode::UNAVAILABLE, message);
		case absl::StatusCode::kInvalidArgument:
			return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
		case absl::StatusCode::kCancelled:
			return grpc::Status(grpc::StatusCode::CANCELLED, message);
		default:
			return grpc::Status(grpc::StatusCode::INTERNAL, message);
	}
}

grpc::Status TimestampOracleServiceImpl::GetTimestamp(ServerContext* context,
		const TimestampRequest* request, TimestampResponse* reply) {
	auto ts = manager_->HandleRequest(request->stream_key(), request->count(),
			[context]() { return context->IsCancelled(); });
	if (!ts.ok()) {
		VLOG(1) << "GetTimestamp(" << request->stream_key() << ", " << request->count()
			<< ") failed: " << ts.status();
		return ToGrpcStatus(ts.status());
	}
	reply->set_physical(ts->physical);
	reply->set_logical(ts->logical);
	reply->set_count(request->count());
	reply->set_composed(ComposeTs(*ts));
	return grpc::Status::OK;
}

grpc::Status TimestampOracleServiceImpl::GetReadiness(ServerContext* context,
		const ReadinessRequest* request, ReadinessResponse* reply) {
	reply->set_ready(manager_->IsReady(request->stream_key()));
	reply->set_healthy(manager_->IsHealthy());
	return grpc::Status::OK;
}

grpc::Status TimestampOracleServiceImpl::ResetTimestamp(ServerContext* context,
		const ResetTimestampRequest* request, ResetTimestampResponse* reply) {
	const Timestamp ts = ParseTs(request->timestamp());
	LOG(INFO) << "ResetTimestamp(" << request->stream_key() << ", " << ts << ") requested by "
		<< context->peer();
	absl::Status status = manager_->ResetUserTimestamp(request->stream_key(), ts,
			request->ignore_smaller(), request->skip_upper_bound_check());
	if (!status.ok()) {
		LOG(WARNING) << "ResetTimestamp failed: " << status;
	}
	return ToGrpcStatus(status);
}

} // namespace Meridian
