
#include "courier.h"
#include "config.h"
#include "cost_estimator.h"
#include "usage_aggregator.h"
#include "conversation_log.h"
#include "orchestrator.h"
#include "dispatcher.h"
#include "providers/registry.h"
#include "server/responder_server.h"

#include <iostream>
#include <string>
#include <cstring>
#include <getopt.h>
#include <csignal>
#include <memory>

// Global debug level (0=off, 1-9=increasing verbosity)
// Used by dprintf() macro in debug.h for fine-grained debug control
int g_debug_level = 0;

// Active responder, for signal-driven shutdown
static ResponderServer* g_server = nullptr;

static void print_usage(int, char** argv) {
	printf("\n=== Courier - LLM completion relay ===\n");
	printf("\nUsage:\n");
	printf("	%s responder [OPTIONS]				Serve completions over HTTP\n", argv[0]);
	printf("	%s send <message> [OPTIONS]			Send one message to a responder\n", argv[0]);
	printf("	%s stream <message> [OPTIONS]		Send one message and print chunks as they arrive\n", argv[0]);
	printf("	%s health|models|stats [OPTIONS]	Query a responder\n", argv[0]);
	printf("	%s config [--local] [OPTIONS]		Show remote (or local) configuration\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-c, --config FILE  Specify config file (default: ~/.config/courier/config.json)\n");
	printf("	-d, --debug[=N]    Enable debug mode with optional level (1-9, default: 1)\n");
	printf("	-l, --log-file	   Log to file instead of console\n");
	printf("	-p, --provider	   Provider for the responder (openai, bedrock, mock)\n");
	printf("	-m, --model		   Model name or alias\n");
	printf("	--context TEXT	   System prompt sent with the message\n");
	printf("	--temperature T    Sampling temperature (0-2)\n");
	printf("	--max-tokens N	   Completion token limit (1-4000)\n");
	printf("	--server-url URL   Responder base URL (default: http://localhost:8000)\n");
	printf("	--host HOST		   Responder bind address (default: 0.0.0.0)\n");
	printf("	--port PORT		   Responder port (default: 8000)\n");
	printf("	--local			   With 'config': print the local configuration\n");
	printf("	-h, --help		   Show this help message\n");
	printf("\nEnvironment:\n");
	printf("	AI_PROVIDER, OPENAI_API_KEY, OPENAI_API_BASE, AWS_REGION, AWS_ACCESS_KEY_ID,\n");
	printf("	AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN, SERVER_URL, RETRY_ATTEMPTS, TIMEOUT_SECONDS,\n");
	printf("	LOG_LEVEL, COURIER_CA_BUNDLE, COURIER_SSL_VERIFY\n");
	printf("\n");
}

static void signal_handler(int signal) {
	printf("\n\nReceived signal %d, shutting down gracefully...\n", signal);
	if (g_server) {
		g_server->shutdown();
	} else {
		exit(0);
	}
}

static CostEstimator build_estimator(const Config& config) {
	RateTable table = RateTable::defaults();
	for (const auto& [model, rate] : config.rates) {
		table.set_rate(model, rate.prompt, rate.completion);
	}
	for (const auto& [alias, model] : config.cost_aliases) {
		table.set_alias(alias, model);
	}
	return CostEstimator(std::move(table));
}

static HttpClientOptions http_options(const Config& config) {
	HttpClientOptions options;
	options.ssl_verify = config.ssl_verify;
	options.ca_bundle = config.ca_bundle;
	options.verbose = g_debug_level >= 5;
	if (!config.ssl_verify) {
		LOG_WARN("TLS certificate verification is disabled");
	}
	return options;
}

static int run_responder(const Config& config) {
	ProviderRegistry registry(config, default_http_client_factory(http_options(config)));
	CostEstimator estimator = build_estimator(config);
	UsageAggregator usage;
	CompletionOrchestrator orchestrator(registry, estimator, usage, config.temperature, config.max_tokens);

	if (!registry.configured()) {
		LOG_WARN("Provider '" + registry.provider_name() + "' is missing credentials; requests will fail until configured");
	}

	ResponderServer server(orchestrator, config.host, config.port);
	g_server = &server;
	int rc = server.run();
	g_server = nullptr;
	return rc;
}

static void print_result(const DispatchResult& result) {
	std::cout << result.to_json().dump(2) << std::endl;
	if (!result.ok()) {
		std::cerr << "Error (" << result.state_name() << " after " << result.attempts
		          << " attempt(s)): " << result.error << std::endl;
	}
}

int main(int argc, char** argv) {
	std::string log_file;
	std::string config_file_path;
	bool show_local = false;

	// Command-line overrides, applied after config load
	struct {
		std::string provider;
		std::string model;
		std::string context;
		std::string server_url;
		std::string host;
		int port = -1;
		double temperature = -1.0;
		int max_tokens = -1;
		bool context_set = false;
	} override;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"model", required_argument, 0, 'm'},
		{"provider", required_argument, 0, 'p'},
		{"context", required_argument, 0, 1000},
		{"temperature", required_argument, 0, 1001},
		{"max-tokens", required_argument, 0, 1002},
		{"server-url", required_argument, 0, 1003},
		{"host", required_argument, 0, 1004},
		{"port", required_argument, 0, 1005},
		{"local", no_argument, 0, 1006},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	try {
		while ((opt = getopt_long(argc, argv, "c:dl:m:p:h", long_options, &option_index)) != -1) {
			switch (opt) {
				case 'c':
					config_file_path = optarg;
					break;
				case 'd':
					// Parse optional debug level (default to 1 if not specified)
					if (optarg) {
						g_debug_level = atoi(optarg);
					} else {
						g_debug_level = 1;
					}
					break;
				case 'l':
					log_file = optarg;
					break;
				case 'm':
					override.model = optarg;
					break;
				case 'p':
					override.provider = optarg;
					break;
				case 1000: // --context
					override.context = optarg;
					override.context_set = true;
					break;
				case 1001: // --temperature
					override.temperature = Config::parse_double(optarg, "--temperature");
					if (override.temperature < 0.0 || override.temperature > 2.0) {
						printf("Error: temperature must be between 0 and 2\n");
						return 1;
					}
					break;
				case 1002: // --max-tokens
					override.max_tokens = static_cast<int>(Config::parse_long(optarg, "--max-tokens"));
					if (override.max_tokens < 1 || override.max_tokens > 4000) {
						printf("Error: max-tokens must be between 1 and 4000\n");
						return 1;
					}
					break;
				case 1003: // --server-url
					override.server_url = optarg;
					break;
				case 1004: // --host
					override.host = optarg;
					break;
				case 1005: // --port
					override.port = static_cast<int>(Config::parse_long(optarg, "--port"));
					if (override.port <= 0 || override.port > 65535) {
						printf("Error: invalid port '%s'\n", optarg);
						return 1;
					}
					break;
				case 1006: // --local
					show_local = true;
					break;
				case 'h':
					print_usage(argc, argv);
					return 0;
				default:
					print_usage(argc, argv);
					return 1;
			}
		}
	} catch (const ConfigError& e) {
		printf("Error: %s\n", e.what());
		return 1;
	}

	// Remaining positional arguments: <command> [message]
	std::vector<std::string> positional;
	for (int i = optind; i < argc; i++) {
		positional.push_back(argv[i]);
	}
	if (positional.empty()) {
		print_usage(argc, argv);
		return 1;
	}
	std::string command = positional[0];

	Logger& logger = Logger::instance();
	if (g_debug_level) {
		logger.set_log_level(LogLevel::DEBUG);
	}
	if (!log_file.empty()) {
		logger.set_log_file(log_file);
		logger.set_console_output(false);
		LOG_INFO("Logging to file: " + log_file);
	}

	Config config;
	try {
		if (!config_file_path.empty()) {
			config.set_config_path(config_file_path);
		}
		config.load();

		if (!override.provider.empty()) config.set_provider(override.provider);
		if (!override.server_url.empty()) config.server_url = override.server_url;
		if (!override.host.empty()) config.host = override.host;
		if (override.port > 0) config.port = override.port;
		if (override.temperature >= 0.0) config.temperature = override.temperature;
		if (override.max_tokens > 0) config.max_tokens = override.max_tokens;

		config.validate();
	} catch (const std::exception& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	// -d wins over the configured level
	if (!g_debug_level) {
		logger.set_log_level(Logger::parse_level(config.log_level));
	}

	signal(SIGINT, signal_handler);
	signal(SIGTERM, signal_handler);

	if (command == "responder") {
		LOG_INFO_FMT("Courier responder starting up (provider {}, {}:{})", config.provider, config.host, config.port);
		try {
			return run_responder(config);
		} catch (const std::exception& e) {
			LOG_FATAL("Responder failed: " + std::string(e.what()));
			return 1;
		}
	}

	if (command == "config" && show_local) {
		std::cout << config.describe() << std::endl;
		return 0;
	}

	// Messenger commands
	DispatcherOptions options;
	options.server_url = config.server_url;
	options.retry_attempts = config.retry_attempts;
	options.timeout_seconds = config.timeout_seconds;

	UsageAggregator usage;
	ConversationLog log;
	RequestDispatcher dispatcher(options, usage, log, default_http_client_factory(http_options(config)));

	if (command == "send" || command == "stream") {
		if (positional.size() < 2) {
			fprintf(stderr, "Error: '%s' requires a message\n", command.c_str());
			return 1;
		}

		DispatchInput input;
		input.message = positional[1];
		for (size_t i = 2; i < positional.size(); i++) {
			input.message += " " + positional[i];
		}
		if (override.context_set) input.context = override.context;
		if (!override.model.empty()) input.model = override.model;
		input.temperature = config.temperature;
		input.max_tokens = config.max_tokens;

		DispatchResult result;
		if (command == "stream") {
			result = dispatcher.send_stream(input, [](const std::string& chunk) {
				std::cout << chunk << std::flush;
			});
			std::cout << std::endl;
			if (!result.ok()) {
				print_result(result);
			}
		} else {
			result = dispatcher.send(input);
			print_result(result);
			if (result.ok()) {
				dprintf(1, "Usage so far: %s", usage.to_json().dump().c_str());
			}
		}
		return result.ok() ? 0 : 1;
	}

	DispatchResult result;
	if (command == "health") {
		result = dispatcher.check_health();
	} else if (command == "models") {
		result = dispatcher.list_models();
	} else if (command == "config") {
		result = dispatcher.remote_config();
	} else if (command == "stats") {
		result = dispatcher.remote_stats();
	} else {
		fprintf(stderr, "Unknown command: %s\n", command.c_str());
		print_usage(argc, argv);
		return 1;
	}

	print_result(result);
	return result.ok() ? 0 : 1;
}
