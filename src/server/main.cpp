#include "common/util/json_config.h"  // Must be before logging.h for InitLoggingFromJson
#include "common/logging.h"
#include "common/util/strings.h"
#include "server/reliable_server.h"
#include "server/echo_command_handler.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

std::atomic<bool> g_running(true);

void HandleSigUsr1(int /*sig*/) {
	LogLevelIncrease();
}

void HandleSigUsr2(int /*sig*/) {
	LogLevelDecrease();
}

void HandleShutdown(int /*sig*/) {
	g_running = false;
}

int main(int argc, char *argv[]) {
	std::string config_file;
	std::string host;
	int port = -1;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--config" || arg == "-c") {
			if (i + 1 < argc) {
				config_file = argv[++i];
			}
		} else if (arg == "--help" || arg == "-h") {
			std::cout << "Usage: " << argv[0] << " [host] [port] [options]\n";
			std::cout << "Options:\n";
			std::cout << "  -c, --config <file>      Set config file\n";
			std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
			std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., NET:DEBUG, SESSION:TRACE)\n";
			std::cout << "                           Modules: NET, NET_PACKET, SESSION, SHELL, CONFIG, MAIN\n";
			std::cout << "  Signal SIGUSR1           Increase log level at runtime\n";
			std::cout << "  Signal SIGUSR2           Decrease log level at runtime\n";
			std::cout << "  -h, --help               Show this help message\n";
			return 0;
		} else if (Strings::BeginsWith(arg, "--log-")) {
			// handled by InitLogging
		} else if (host.empty()) {
			host = arg;
		} else if (port < 0 && Strings::IsNumber(arg)) {
			if (!Strings::ToPort(arg, 0, port)) {
				std::cerr << "Port must be in 0-65535: " << arg << "\n";
				return 1;
			}
		} else {
			std::cerr << "Unexpected argument: " << arg << "\n";
			return 1;
		}
	}

	InitLogging(argc, argv);

	signal(SIGUSR1, HandleSigUsr1);
	signal(SIGUSR2, HandleSigUsr2);
	signal(SIGINT, HandleShutdown);
	signal(SIGTERM, HandleShutdown);

	auto config = RDSH::JsonConfigFile::Load(config_file);
	if (config.RawHandle().isObject()) {
		InitLoggingFromJson(config.RawHandle());
	}

	auto opts = RDSH::Net::ReliableServerOptions::FromConfig(config);
	if (!host.empty()) {
		opts.host = host;
	}
	if (port >= 0) {
		opts.port = port;
	}

	LOG_INFO(MOD_MAIN, "Log level: {} (use --log-level=LEVEL to change)", GetLevelName(static_cast<LogLevel>(GetLogLevel())));

	RDSH::Net::ReliableServer server(opts, std::make_shared<RDSH::EchoCommandHandler>());
	if (!server.Start()) {
		std::cerr << "Failed to start server on " << opts.host << ":" << opts.port << "\n";
		return 1;
	}

	std::cout << "rdsh server listening on " << opts.host << ":" << server.LocalPort() << "\n";

	while (g_running) {
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	auto stats = server.GetSocketStats();
	server.Stop();

	std::cout << "Server stopped. Packets received: " << Strings::Commify(stats.recv_packets)
		<< ", packets sent: " << Strings::Commify(stats.sent_packets) << "\n";
	return 0;
}
