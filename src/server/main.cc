#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "tso_server.h"

namespace {

void OverrideString(const cxxopts::ParseResult& arguments, const std::string& flag,
		Meridian::ConfigValue<std::string>& value) {
	const std::string flag_value = arguments[flag].as<std::string>();
	if (!flag_value.empty()) {
		value.set(flag_value);
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("meridian_server", "Timestamp oracle server");
	options.add_options()
		("config", "YAML config file", cxxopts::value<std::string>()->default_value(""))
		("name", "Human readable name of this server", cxxopts::value<std::string>()->default_value(""))
		("l,log-level", "Verbose log level", cxxopts::value<int>())
		("log-file", "Log file, stderr when empty", cxxopts::value<std::string>()->default_value(""))
		("cacert", "CA certificate for client verification", cxxopts::value<std::string>()->default_value(""))
		("cert", "Server certificate", cxxopts::value<std::string>()->default_value(""))
		("key", "Server private key", cxxopts::value<std::string>()->default_value(""))
		("backend-endpoints", "Checkpoint store, memory:// or file://<dir>",
		 cxxopts::value<std::string>()->default_value(""))
		("listen-addr", "gRPC listen address", cxxopts::value<std::string>()->default_value(""))
		("enable-local-tso", "Serve local timestamp streams")
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	// *************** Configuration **********************
	Meridian::Configuration& configuration = Meridian::Configuration::getInstance();
	const std::string config_file = arguments["config"].as<std::string>();
	if (!config_file.empty() && !configuration.loadFromFile(config_file)) {
		LOG(ERROR) << "Failed to load config file " << config_file;
		return EXIT_FAILURE;
	}

	Meridian::MeridianConfig& config = configuration.config();
	OverrideString(arguments, "name", config.server.name);
	OverrideString(arguments, "log-file", config.log.file);
	OverrideString(arguments, "cacert", config.security.cacert);
	OverrideString(arguments, "cert", config.security.cert);
	OverrideString(arguments, "key", config.security.key);
	OverrideString(arguments, "backend-endpoints", config.server.backend_endpoints);
	OverrideString(arguments, "listen-addr", config.server.listen_addr);
	if (arguments.count("log-level")) {
		config.log.level.set(arguments["log-level"].as<int>());
	}
	if (arguments.count("enable-local-tso")) {
		config.tso.enable_local_tso.set(true);
	}

	FLAGS_v = config.log.level.get();
	const std::string log_file = config.log.file.get();
	if (log_file.empty()) {
		FLAGS_logtostderr = 1; // log only to console, no files
	} else {
		google::SetLogDestination(google::GLOG_INFO, log_file.c_str());
	}

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	// Shutdown signals are taken synchronously below; block them before any thread starts
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	// *************** Serve **********************
	Meridian::TsoServer server(config);
	server.AddStartCallback([&server]() {
		LOG(INFO) << "Meridian " << server.Name() << " initialized. Ready to go";
	});
	absl::Status status = server.Run();
	if (!status.ok()) {
		LOG(ERROR) << "Failed to start " << server.Name() << ": " << status;
		return EXIT_FAILURE;
	}

	int signal = 0;
	sigwait(&signals, &signal);
	LOG(INFO) << "Received signal " << signal << ", shutting down";
	server.Close();

	LOG(INFO) << "Meridian Terminating";
	return EXIT_SUCCESS;
}
