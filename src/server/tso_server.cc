#include "tso_server.h"

#include <fstream>
#include <sstream>
#include <utility>

#include <glog/logging.h>

namespace Meridian {

namespace {

absl::Status ReadFile(const std::string& path, std::string* content) {
	std::ifstream file(path);
	if (!file.is_open()) {
		return absl::InvalidArgumentError("cannot open " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	*content = buffer.str();
	return absl::OkStatus();
}

} // namespace

TsoServer::TsoServer(const MeridianConfig& config)
	: config_(config),
	  name_(config.server.name.get()),
	  election_(name_),
	  guard_(&election_) {}

TsoServer::~TsoServer() {
	Close();
}

void TsoServer::AddStartCallback(std::function<void()> callback) {
	start_callbacks_.push_back(std::move(callback));
}

void TsoServer::AddLeaderCallback(std::function<void(uint64_t)> callback) {
	leader_callbacks_.push_back(std::move(callback));
}

absl::Status TsoServer::BuildCredentials(std::shared_ptr<grpc::ServerCredentials>* credentials) const {
	const std::string cert_path = config_.security.cert.get();
	const std::string key_path = config_.security.key.get();
	if (cert_path.empty() && key_path.empty()) {
		*credentials = grpc::InsecureServerCredentials();
		return absl::OkStatus();
	}

	grpc::SslServerCredentialsOptions::PemKeyCertPair pair;
	absl::Status status = ReadFile(cert_path, &pair.cert_chain);
	if (status.ok()) {
		status = ReadFile(key_path, &pair.private_key);
	}
	if (!status.ok()) {
		return status;
	}

	const std::string cacert_path = config_.security.cacert.get();
	grpc::SslServerCredentialsOptions options(GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE);
	if (!cacert_path.empty()) {
		status = ReadFile(cacert_path, &options.pem_root_certs);
		if (!status.ok()) {
			return status;
		}
		options.client_certificate_request = GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;
	}
	options.pem_key_cert_pairs.push_back(std::move(pair));
	*credentials = grpc::SslServerCredentials(options);
	return absl::OkStatus();
}

absl::Status TsoServer::Run() {
	const std::string backend = config_.server.backend_endpoints.get();
	auto store = OpenCheckpointStore(backend);
	if (!store.ok()) {
		LOG(ERROR) << "[TsoServer] Cannot open checkpoint store " << backend << ": " << store.status();
		return store.status();
	}
	store_ = std::move(*store);

	manager_ = std::make_unique<AllocatorManager>(TsoOptions::FromConfig(config_.tso),
			config_.tso.enable_local_tso.get(), config_.tso.local_regions, store_.get(), &guard_, &clock_);
	// Registered after the manager so allocators are ready when these run
	for (auto& callback : leader_callbacks_) {
		guard_.RegisterElectedCallback(callback);
	}

	std::shared_ptr<grpc::ServerCredentials> credentials;
	absl::Status status = BuildCredentials(&credentials);
	if (!status.ok()) {
		LOG(ERROR) << "[TsoServer] Invalid TLS configuration: " << status;
		return status;
	}

	const std::string listen_addr = config_.server.listen_addr.get();
	service_ = std::make_unique<TimestampOracleServiceImpl>(manager_.get());
	grpc::ServerBuilder builder;
	builder.AddListeningPort(listen_addr, credentials);
	builder.RegisterService(service_.get());
	server_ = builder.BuildAndStart();
	if (!server_) {
		LOG(ERROR) << "[TsoServer] Failed to listen on " << listen_addr;
		return absl::UnavailableError("failed to listen on " + listen_addr);
	}
	LOG(INFO) << "[TsoServer] " << name_ << " listening on " << listen_addr << " backend:" << backend;

	manager_->Start();
	election_.Elect();

	for (auto& callback : start_callbacks_) {
		callback();
	}
	return absl::OkStatus();
}

void TsoServer::Wait() {
	if (server_) {
		server_->Wait();
	}
}

void TsoServer::Close() {
	if (closed_) {
		return;
	}
	closed_ = true;
	LOG(INFO) << "[TsoServer] " << name_ << " closing";
	election_.Depose();
	if (server_) {
		server_->Shutdown();
	}
	if (manager_) {
		manager_->Stop();
	}
}

} // namespace Meridian
