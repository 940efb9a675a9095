#include "common/util/json_config.h"  // Must be before logging.h for InitLoggingFromJson
#include "common/logging.h"
#include "common/util/strings.h"
#include "client/reliable_client.h"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>

void HandleSigUsr1(int /*sig*/) {
	LogLevelIncrease();
}

void HandleSigUsr2(int /*sig*/) {
	LogLevelDecrease();
}

int main(int argc, char *argv[]) {
	std::string config_file;
	std::string host;
	int port = -1;
	int num_commands = 10;
	uint64_t file_size = 1024 * 1024;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--config" || arg == "-c") {
			if (i + 1 < argc) {
				config_file = argv[++i];
			}
		} else if (arg == "--commands" || arg == "-n") {
			if (i + 1 < argc) {
				num_commands = std::atoi(argv[++i]);
			}
		} else if (arg == "--file-size" || arg == "-f") {
			if (i + 1 < argc) {
				file_size = Strings::ToUnsignedBigInt(argv[++i], file_size);
			}
		} else if (arg == "--help" || arg == "-h") {
			std::cout << "Usage: " << argv[0] << " [host] [port] [options]\n";
			std::cout << "Options:\n";
			std::cout << "  -c, --config <file>      Set config file\n";
			std::cout << "  -n, --commands <count>   Number of echo commands to run (default: 10)\n";
			std::cout << "  -f, --file-size <bytes>  Size of the uploaded test file (default: 1048576)\n";
			std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
			std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., NET:DEBUG, SHELL:TRACE)\n";
			std::cout << "                           Modules: NET, NET_PACKET, SESSION, SHELL, CONFIG, MAIN\n";
			std::cout << "  -h, --help               Show this help message\n";
			return 0;
		} else if (Strings::BeginsWith(arg, "--log-")) {
			// handled by InitLogging
		} else if (host.empty()) {
			host = arg;
		} else if (port < 0 && Strings::IsNumber(arg)) {
			if (!Strings::ToPort(arg, 1, port)) {
				std::cerr << "Port must be in 1-65535: " << arg << "\n";
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

	auto config = RDSH::JsonConfigFile::Load(config_file);
	if (config.RawHandle().isObject()) {
		InitLoggingFromJson(config.RawHandle());
	}

	auto opts = RDSH::Net::ReliableClientOptions::FromConfig(config);
	if (!host.empty()) {
		opts.host = host;
	}
	if (port >= 0) {
		opts.port = port;
	}

	RDSH::Net::ReliableClient client(opts);
	auto connected = client.Connect();
	if (!connected.success) {
		std::cerr << "Failed to connect via " << client.ProtocolName() << " to " << opts.host << ":" << opts.port << ". Exiting.\n";
		return 1;
	}

	std::cout << std::fixed << std::setprecision(4);
	std::cout << client.Welcome();
	std::cout << "\nConnection time: " << connected.elapsed_seconds << " seconds\n";

	double total_command_time = 0.0;
	int completed = 0;
	for (int i = 0; i < num_commands; i++) {
		auto response = client.SendCommand("echo This is test command " + std::to_string(i));
		if (response) {
			total_command_time += response->elapsed_seconds;
			completed++;
		}
	}

	if (completed > 0) {
		std::cout << "Commands completed: " << completed << "/" << num_commands
			<< ", average time: " << (total_command_time / completed) << " seconds\n";
	}
	else if (num_commands > 0) {
		std::cout << "No command completed\n";
	}

	if (file_size > 0) {
		auto transfer = client.SendFile(std::string(file_size, 'X'), "test_file.txt");
		if (transfer) {
			std::cout << "File transfer: " << Strings::Commify(transfer->file_size) << " bytes in "
				<< transfer->elapsed_seconds << " seconds ("
				<< Strings::Commify((uint64_t)transfer->bytes_per_second) << " bytes/sec)\n";
		}
		else {
			std::cout << "File transfer failed\n";
		}
	}

	client.Disconnect();

	auto counters = client.GetCounters();
	std::cout << "Protocol: " << client.ProtocolName() << "\n";
	std::cout << "Total data sent: " << Strings::Commify(counters.bytes_sent) << " bytes\n";
	std::cout << "Total data received: " << Strings::Commify(counters.bytes_received) << " bytes\n";
	return 0;
}
