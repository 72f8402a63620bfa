#include "arsenal_catalog.h"
#include "arsenal_logger.h"
#include "arsenal_registry.h"
#include "arsenal_server.h"
#include "arsenal_tracer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

	std::atomic<bool> g_stop{false};

	void on_signal(int) {
		g_stop = true;
	}

	void print_usage(const char* program) {
		std::cout << "Usage: " << program << " [options]\n"
			<< "  --host <addr>          Listen address (default 0.0.0.0, env ARSENAL_HOST)\n"
			<< "  --port <port>          Listen port (default 7860, env ARSENAL_PORT)\n"
			<< "  --heartbeat <seconds>  SSE heartbeat interval (default 30)\n"
			<< "  --log-level <level>    debug, info, warning or error (env ARSENAL_LOG_LEVEL)\n"
			<< "  --trace                Log a span for every tool call\n"
			<< "  --help                 Show this message\n";
	}

	int parse_int(const std::string& flag, const std::string& value) {
		try {
			size_t used = 0;
			int parsed = std::stoi(value, &used);
			if (used != value.size()) {
				throw std::invalid_argument(value);
			}
			return parsed;
		} catch (const std::logic_error&) {
			throw std::invalid_argument("invalid value for " + flag + ": " + value);
		}
	}

} // namespace

int main(int argc, char** argv) {
	arsenal::server::configuration conf;
	std::string log_level = "info";
	bool tracing = false;

	if (const char* host = std::getenv("ARSENAL_HOST")) {
		conf.host = host;
	}
	if (const char* level = std::getenv("ARSENAL_LOG_LEVEL")) {
		log_level = level;
	}

	try {
		if (const char* port = std::getenv("ARSENAL_PORT")) {
			conf.port = parse_int("ARSENAL_PORT", port);
		}

		for (int i = 1; i < argc; ++i) {
			std::string arg = argv[i];
			auto next = [&]() -> std::string {
				if (i + 1 >= argc) {
					throw std::invalid_argument("missing value for " + arg);
				}
				return argv[++i];
			};

			if (arg == "--help" || arg == "-h") {
				print_usage(argv[0]);
				return 0;
			} else if (arg == "--host") {
				conf.host = next();
			} else if (arg == "--port") {
				conf.port = parse_int(arg, next());
			} else if (arg == "--heartbeat") {
				int seconds = parse_int(arg, next());
				if (seconds <= 0) {
					throw std::invalid_argument("--heartbeat must be positive");
				}
				conf.heartbeat_interval = std::chrono::seconds(seconds);
			} else if (arg == "--log-level") {
				log_level = next();
			} else if (arg == "--trace") {
				tracing = true;
			} else {
				throw std::invalid_argument("unknown option: " + arg);
			}
		}
	} catch (const std::invalid_argument& e) {
		std::cerr << e.what() << "\n";
		print_usage(argv[0]);
		return 2;
	}

	if (!arsenal::logger::instance().set_level(log_level)) {
		LOG_WARNING("Unknown log level '", log_level, "', keeping info");
	}

	auto catalog = std::make_shared<const arsenal::arsenal_catalog>(conf.platform);
	conf.arsenal_tools = static_cast<size_t>(catalog->total_tool_count());
	conf.bleeding_edge = catalog->bleeding_edge().enabled;

	std::shared_ptr<arsenal::tracer> tracer;
	if (tracing) {
		tracer = std::make_shared<arsenal::log_tracer>();
	}

	auto registry = std::make_shared<arsenal::tool_registry>();
	try {
		arsenal::register_catalog_tools(*registry, catalog, tracer);
	} catch (const arsenal::duplicate_tool_error& e) {
		LOG_ERROR("Tool registration failed: ", e.what());
		return 1;
	}

	arsenal::server server(conf, registry, arsenal::default_capabilities(), tracer);

	std::signal(SIGINT, on_signal);
	std::signal(SIGTERM, on_signal);

	if (!server.start(false)) {
		return 1;
	}

	std::cout << "Arsenal MCP server listening on " << conf.host << ":" << server.port()
		<< conf.sse_endpoint << std::endl;
	std::cout << "Press Ctrl+C to stop the server" << std::endl;

	while (!g_stop) {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
	}

	server.stop();
	return 0;
}
