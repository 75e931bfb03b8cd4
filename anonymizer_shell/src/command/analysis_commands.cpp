#include "command_base.hpp"
#include "command_codec.hpp"
#include "command_registry.hpp"

#include "../logger.hpp"

#include <memory>

#include <log4cplus/loggingmacros.h>

namespace sidecar::commands {

namespace {

std::string summarize(const CategoryCounts& summary) {
    std::string text;
    for (const auto& [category, count] : summary) {
        if (!text.empty()) {
            text += ", ";
        }
        text += category + "=" + std::to_string(count);
    }
    return text.empty() ? "none" : text;
}

class AnalyzeTextCommand final : public CommandHandler {
public:
    const char* name() const override { return "analyze_text"; }

    Document handle(const CommandContext& ctx) override {
        AnalyzeTextArgs args = decode_analyze_text_args(ensure_args_map(ctx));
        AnalyzeTextResult result = ctx.router.analyze_text(args, ctx.cancel);
        LOG4CPLUS_INFO(router_logger(), "analyze_text run=" << result.run_id << " language=" << result.language
                                        << " findings=" << result.findings_count << " (" << summarize(result.summary) << ")");
        return to_document(result);
    }
};

class AnalyzeFileCommand final : public CommandHandler {
public:
    const char* name() const override { return "analyze_file"; }

    Document handle(const CommandContext& ctx) override {
        AnalyzeFileArgs args = decode_analyze_file_args(ensure_args_map(ctx));
        AnalyzeFileResult result = ctx.router.analyze_file(args, ctx.cancel);
        LOG4CPLUS_INFO(router_logger(), "analyze_file run=" << result.run_id << " output=" << result.output_path
                                        << " findings=" << result.findings_count);
        return to_document(result);
    }
};

class AnalyzeBatchCommand final : public CommandHandler {
public:
    const char* name() const override { return "analyze_batch"; }

    Document handle(const CommandContext& ctx) override {
        AnalyzeBatchArgs args = decode_analyze_batch_args(ensure_args_map(ctx));
        AnalyzeBatchResult result = ctx.router.analyze_batch(args, ctx.cancel);
        LOG4CPLUS_INFO(router_logger(), "analyze_batch run=" << result.run_id << " processed=" << result.processed_files
                                        << " skipped=" << result.skipped_files << "/" << result.total_files_seen);
        return to_document(result);
    }
};

} // namespace

void register_analysis_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<AnalyzeTextCommand>());
    registry.add(std::make_unique<AnalyzeFileCommand>());
    registry.add(std::make_unique<AnalyzeBatchCommand>());
}

} // namespace sidecar::commands
