// SPDX-License-Identifier: MIT

// bulkload <node-config.json> [message.json]
//
// Runs one bulk insert invocation. The message is read from the given file
// or from stdin, and the resulting message (with the summary written back)
// is printed to stdout. Logs go to stderr; BULKLOAD_LOG_LEVEL sets the level.

#include "bulkload/bulk_insert.hpp"
#include "bulkload/config.hpp"
#include "bulkload/error.hpp"
#include "bulkload/expression.hpp"
#include "bulkload/summary.hpp"
#include "bulkload/value.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <asio.hpp>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace {

std::optional<std::string> read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void configure_logging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("bulkload"));
    if (const char* level = std::getenv("BULKLOAD_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <node-config.json> [message.json]\n";
        std::cerr << "\nReads the message from stdin when no file is given.\n";
        return 1;
    }

    configure_logging();

    auto config_text = read_text(argv[1]);
    if (!config_text) {
        spdlog::error("cannot read config file {}", argv[1]);
        return 1;
    }
    auto config = bulkload::parse_node_config(*config_text);
    if (!config) {
        spdlog::error("{}: {}", bulkload::error_code_name(config.error().code),
                      config.error().message);
        return 1;
    }

    std::string message_text;
    if (argc == 3) {
        auto text = read_text(argv[2]);
        if (!text) {
            spdlog::error("cannot read message file {}", argv[2]);
            return 1;
        }
        message_text = std::move(*text);
    } else {
        message_text.assign(std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>());
    }

    rapidjson::Document msg;
    msg.Parse(message_text.data(), message_text.size());
    if (msg.HasParseError() || !msg.IsObject()) {
        spdlog::error("message is not a JSON object: {}",
                      msg.HasParseError() ? rapidjson::GetParseError_En(msg.GetParseError())
                                          : "wrong type");
        return 1;
    }

    bulkload::ContextStore flow;
    bulkload::ContextStore global;
    bulkload::PathExpressionEvaluator evaluator;
    bulkload::BulkInsertNode node(std::move(*config), flow, global, evaluator);
    node.on_status([](const bulkload::Status& status) {
        spdlog::debug("status [{}] {}", bulkload::status_fill_name(status.fill), status.text);
    });

    asio::io_context ctx;
    auto result = asio::co_spawn(ctx, node.handle(msg), asio::use_future);
    ctx.run();

    try {
        result.get();
    } catch (const bulkload::BulkLoadError& e) {
        spdlog::error("{}: {}", bulkload::error_code_name(e.code()), e.what());
        if (const auto* partial = e.partial_summary()) {
            rapidjson::Document doc;
            auto json = bulkload::to_json(*partial, doc.GetAllocator());
            spdlog::error("durable before abort: {}", bulkload::to_json_string(json));
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    std::cout << bulkload::to_json_string(msg) << '\n';
    return 0;
}
