#include <gtest/gtest.h>

#include "command/command_codec.hpp"
#include "command/command_router.hpp"
#include "sidecar_bridge.hpp"
#include "sidecar_error.hpp"
#include "test_helpers.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace sidecar;
using namespace sidecar::commands;

namespace {

// Records the last call and answers with a canned document or error.
class FakeExecutor final : public SidecarExecutor {
public:
    Document execute(const std::string& command,
                     const Document& payload,
                     const CancellationToken*) const override {
        last_command = command;
        last_payload = payload;
        if (failure) {
            throw *failure;
        }
        return response;
    }

    Document response;
    std::optional<SidecarError> failure;
    mutable std::string last_command;
    mutable Document last_payload;
};

Document text_result() {
    return Document::parse(R"({
        "run_id": "r-17", "run_folder": "/runs/r-17", "redacted_text": "[PERSON] called",
        "summary": {"PERSON": 1}, "findings_count": 1, "language": "de"
    })");
}

RouterError capture_router_error(const std::function<void()>& call) {
    try {
        call();
    } catch (const RouterError& exc) {
        return exc;
    }
    ADD_FAILURE() << "call did not throw RouterError";
    return RouterError(RouterErrorKind::EncodingFailure, "none", "none");
}

} // namespace

TEST(CommandRouter, AnalyzeTextUsesWorkerFieldNames) {
    FakeExecutor executor;
    executor.response = text_result();
    CommandRouter router(executor);

    AnalyzeTextArgs args{"Anna Schmidt called", test::sample_preset(), std::string("/models/ner")};
    AnalyzeTextResult result = router.analyze_text(args);

    EXPECT_EQ(executor.last_command, "analyze_text");
    const Document& payload = executor.last_payload;
    EXPECT_EQ(payload["text"], "Anna Schmidt called");
    EXPECT_EQ(payload["model_path"], "/models/ner");
    EXPECT_EQ(payload["preset"]["minimum_confidence"], 80);
    EXPECT_TRUE(payload["preset"]["language"].is_null());
    EXPECT_FALSE(payload["preset"].contains("whitelist"));
    EXPECT_EQ(payload["preset"]["entities_enabled"], Document::parse(R"({"EMAIL": false, "PERSON": true})"));

    EXPECT_EQ(result.run_id, "r-17");
    EXPECT_EQ(result.run_folder, "/runs/r-17");
    EXPECT_EQ(result.redacted_text, "[PERSON] called");
    EXPECT_EQ(result.summary, (CategoryCounts{{"PERSON", 1}}));
    EXPECT_EQ(result.findings_count, 1u);
    EXPECT_EQ(result.language, "de");
}

TEST(CommandRouter, OmitsUnsetModelPath) {
    FakeExecutor executor;
    executor.response = text_result();
    CommandRouter router(executor);

    router.analyze_text(AnalyzeTextArgs{"text", test::sample_preset(), std::nullopt});
    EXPECT_FALSE(executor.last_payload.contains("model_path"));
    EXPECT_EQ(executor.last_payload.size(), 2u);
}

TEST(CommandRouter, AnalyzeFileRequestAndResult) {
    FakeExecutor executor;
    executor.response = Document::parse(R"({
        "run_id": "r-2", "run_folder": "/runs/r-2", "output_path": "/runs/r-2/contract.redacted.docx",
        "summary": {"EMAIL": 4, "PERSON": 2}, "findings_count": 6
    })");
    CommandRouter router(executor);

    AnalyzeFileResult result = router.analyze_file(AnalyzeFileArgs{"/home/u/contract.docx", test::sample_preset()});

    EXPECT_EQ(executor.last_command, "analyze_file");
    EXPECT_EQ(executor.last_payload["input_path"], "/home/u/contract.docx");
    EXPECT_EQ(executor.last_payload.size(), 2u);
    EXPECT_EQ(result.output_path, "/runs/r-2/contract.redacted.docx");
    EXPECT_EQ(result.summary.at("EMAIL"), 4u);
    EXPECT_EQ(result.findings_count, 6u);
}

TEST(CommandRouter, AnalyzeBatchEncodesOptionalFields) {
    FakeExecutor executor;
    executor.response = Document::parse(R"({
        "run_id": "b-1", "run_folder": "/runs/b-1", "processed_files": 3, "skipped_files": 1,
        "total_files_seen": 4, "summary": {}, "output_folder": "/runs/b-1/out"
    })");
    CommandRouter router(executor);

    AnalyzeBatchArgs minimal;
    minimal.input_folder = "/data/in";
    minimal.preset = test::sample_preset();
    router.analyze_batch(minimal);
    EXPECT_EQ(executor.last_payload["recursive"], true);
    EXPECT_FALSE(executor.last_payload.contains("language"));
    EXPECT_FALSE(executor.last_payload.contains("max_files"));
    EXPECT_FALSE(executor.last_payload.contains("runs_base"));

    AnalyzeBatchArgs full = minimal;
    full.recursive = false;
    full.language = "fr";
    full.max_files = 10;
    full.runs_base = "/srv/runs";
    AnalyzeBatchResult result = router.analyze_batch(full);

    EXPECT_EQ(executor.last_command, "analyze_batch");
    EXPECT_EQ(executor.last_payload["recursive"], false);
    EXPECT_EQ(executor.last_payload["language"], "fr");
    EXPECT_EQ(executor.last_payload["max_files"], 10);
    EXPECT_EQ(executor.last_payload["runs_base"], "/srv/runs");
    EXPECT_EQ(result.processed_files, 3u);
    EXPECT_EQ(result.skipped_files, 1u);
    EXPECT_EQ(result.total_files_seen, 4u);
    EXPECT_TRUE(result.summary.empty());
    EXPECT_EQ(result.output_folder, "/runs/b-1/out");
}

TEST(CommandRouter, SupportedExtensionsSendEmptyPayload) {
    FakeExecutor executor;
    executor.response = Document::parse(R"({"extensions": ["md", "txt"]})");
    CommandRouter router(executor);

    SupportedExtensions result = router.get_supported_extensions();
    EXPECT_EQ(executor.last_command, "get_supported_extensions");
    EXPECT_EQ(executor.last_payload, Document::object());
    EXPECT_EQ(result.extensions, (std::vector<std::string>{"md", "txt"}));
}

TEST(CommandRouter, MissingFieldIsDecodingFailure) {
    FakeExecutor executor;
    executor.response = text_result();
    executor.response.erase("language");
    CommandRouter router(executor);

    RouterError error = capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); });
    EXPECT_EQ(error.kind(), RouterErrorKind::DecodingFailure);
    EXPECT_EQ(error.raw_document(), executor.response);
    EXPECT_NE(std::string(error.what()).find("missing field 'language'"), std::string::npos);
}

TEST(CommandRouter, UnexpectedFieldIsDecodingFailure) {
    FakeExecutor executor;
    executor.response = text_result();
    executor.response["warnings"] = Document::array();
    CommandRouter router(executor);

    RouterError error = capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); });
    EXPECT_EQ(error.kind(), RouterErrorKind::DecodingFailure);
    EXPECT_NE(std::string(error.what()).find("unexpected field 'warnings'"), std::string::npos);
}

TEST(CommandRouter, WrongTypesAreDecodingFailures) {
    FakeExecutor executor;
    CommandRouter router(executor);

    executor.response = text_result();
    executor.response["findings_count"] = "1";
    EXPECT_EQ(capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); }).kind(),
              RouterErrorKind::DecodingFailure);

    executor.response = text_result();
    executor.response["summary"]["PERSON"] = -1;
    EXPECT_EQ(capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); }).kind(),
              RouterErrorKind::DecodingFailure);

    executor.response = Document::parse(R"({"extensions": ["txt", 4]})");
    RouterError error = capture_router_error([&]() { router.get_supported_extensions(); });
    EXPECT_EQ(error.kind(), RouterErrorKind::DecodingFailure);
    EXPECT_NE(std::string(error.what()).find("extensions[1]"), std::string::npos);
}

TEST(CommandRouter, BridgeFailureKeepsKindAndText) {
    FakeExecutor executor;
    executor.failure = SidecarError(ErrorKind::WorkerReportedFailure, "model not found");
    CommandRouter router(executor);

    RouterError error = capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); });
    EXPECT_EQ(error.kind(), RouterErrorKind::BridgeFailure);
    ASSERT_TRUE(error.bridge_kind().has_value());
    EXPECT_EQ(*error.bridge_kind(), ErrorKind::WorkerReportedFailure);
    EXPECT_EQ(error.command(), "analyze_text");
    EXPECT_STREQ(error.what(), "analyze_text: sidecar reported failure: model not found");
}

TEST(CommandRouter, PresetListsRoundTrip) {
    Preset preset = test::sample_preset();
    preset.language = "de";
    preset.whitelist = std::vector<std::string>{"ACME GmbH"};
    preset.blacklist = std::vector<std::string>{"Projekt Falke"};
    preset.language_whitelists = std::map<std::string, std::vector<std::string>>{{"de", {"Berlin"}}};
    preset.language_blacklists = std::map<std::string, std::vector<std::string>>{{"en", {}}};

    Document encoded = encode_preset(preset);
    EXPECT_EQ(encoded["language"], "de");
    EXPECT_EQ(encoded["language_whitelists"]["de"][0], "Berlin");
    EXPECT_EQ(decode_preset(encoded), preset);
    EXPECT_NE(decode_preset(encoded), test::sample_preset());
}

TEST(CommandRouter, PresetShapeIsChecked) {
    Document doc = encode_preset(test::sample_preset());
    doc["entities_enabled"]["PERSON"] = "yes";
    EXPECT_THROW(decode_preset(doc), DecodeError);

    doc = encode_preset(test::sample_preset());
    doc.erase("layer");
    EXPECT_THROW(decode_preset(doc), DecodeError);

    doc = encode_preset(test::sample_preset());
    doc["whitelist"] = "ACME";
    EXPECT_THROW(decode_preset(doc), DecodeError);
}

TEST(CommandRouter, StubWorkerEndToEnd) {
    SidecarBridge bridge(test::stub_config());
    CommandRouter router(bridge);

    AnalyzeTextResult text = router.analyze_text({"Jane Doe", test::sample_preset(), {}});
    EXPECT_EQ(text.run_id, "run-0001");
    EXPECT_EQ(text.redacted_text, "[REDACTED 8 chars]");
    EXPECT_EQ(text.findings_count, 3u);
    EXPECT_EQ(text.summary, (CategoryCounts{{"EMAIL", 1}, {"PERSON", 2}}));

    AnalyzeFileResult file = router.analyze_file({"/data/memo.txt", test::sample_preset()});
    EXPECT_EQ(file.output_path, "/data/memo.txt.redacted");

    AnalyzeBatchArgs batch_args;
    batch_args.input_folder = "/data";
    batch_args.preset = test::sample_preset();
    batch_args.max_files = 10;
    AnalyzeBatchResult batch = router.analyze_batch(batch_args);
    EXPECT_EQ(batch.total_files_seen, 12u);
    EXPECT_EQ(batch.processed_files, 10u);
    EXPECT_EQ(batch.skipped_files, 2u);
    EXPECT_EQ(batch.output_folder, "/data/redacted");

    EXPECT_EQ(router.get_supported_extensions().extensions, (std::vector<std::string>{"txt", "pdf", "docx"}));
}

TEST(CommandRouter, StubWorkerShapeViolations) {
    SidecarBridge missing_bridge(test::stub_config("bad_shape"));
    CommandRouter missing(missing_bridge);
    EXPECT_EQ(capture_router_error([&]() { missing.get_supported_extensions(); }).kind(),
              RouterErrorKind::DecodingFailure);

    SidecarBridge extra_bridge(test::stub_config("extra_field"));
    CommandRouter extra(extra_bridge);
    RouterError error = capture_router_error([&]() { extra.analyze_file({"/data/a.pdf", test::sample_preset()}); });
    EXPECT_EQ(error.kind(), RouterErrorKind::DecodingFailure);
    EXPECT_TRUE(error.raw_document().contains("debug_trace"));
}

TEST(CommandRouter, StubWorkerFailuresAreBridgeFailures) {
    SidecarBridge bridge(test::stub_config("error_field"));
    CommandRouter router(bridge);

    RouterError error = capture_router_error([&]() { router.analyze_text({"t", test::sample_preset(), {}}); });
    EXPECT_EQ(error.kind(), RouterErrorKind::BridgeFailure);
    EXPECT_EQ(error.bridge_kind(), std::optional<ErrorKind>(ErrorKind::WorkerReportedFailure));
    EXPECT_NE(std::string(error.what()).find("model not found"), std::string::npos);
}
