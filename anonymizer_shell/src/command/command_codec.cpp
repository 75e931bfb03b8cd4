#include "command_codec.hpp"

#include <limits>
#include <set>
#include <utility>

namespace sidecar::commands {

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& what) {
    throw DecodeError(path + ": " + what);
}

std::string type_of(const Document& value) {
    return value.type_name();
}

std::string expect_string(const Document& value, const std::string& path) {
    if (!value.is_string()) {
        fail(path, "expected string, got " + type_of(value));
    }
    return value.get<std::string>();
}

bool expect_bool(const Document& value, const std::string& path) {
    if (!value.is_boolean()) {
        fail(path, "expected boolean, got " + type_of(value));
    }
    return value.get<bool>();
}

uint64_t expect_count(const Document& value, const std::string& path) {
    if (!value.is_number_unsigned()) {
        fail(path, "expected non-negative integer, got " + type_of(value));
    }
    return value.get<uint64_t>();
}

int64_t expect_integer(const Document& value, const std::string& path) {
    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            fail(path, "integer out of range");
        }
        return static_cast<int64_t>(raw);
    }
    if (!value.is_number_integer()) {
        fail(path, "expected integer, got " + type_of(value));
    }
    return value.get<int64_t>();
}

std::vector<std::string> expect_string_list(const Document& value, const std::string& path) {
    if (!value.is_array()) {
        fail(path, "expected array, got " + type_of(value));
    }
    std::vector<std::string> items;
    items.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        items.push_back(expect_string(value[i], path + "[" + std::to_string(i) + "]"));
    }
    return items;
}

template <typename T, typename Convert>
std::map<std::string, T> expect_map(const Document& value, const std::string& path, Convert convert) {
    if (!value.is_object()) {
        fail(path, "expected object, got " + type_of(value));
    }
    std::map<std::string, T> entries;
    for (const auto& [key, item] : value.items()) {
        entries.emplace(key, convert(item, path + "." + key));
    }
    return entries;
}

// Reads an object field by field and rejects keys nobody asked for.
class FieldReader {
public:
    FieldReader(const Document& doc, std::string path)
        : doc_(doc), path_(std::move(path)) {
        if (!doc_.is_object()) {
            fail(path_, "expected object, got " + type_of(doc_));
        }
    }

    const Document& require(const std::string& key) {
        auto it = doc_.find(key);
        if (it == doc_.end()) {
            fail(path_, "missing field '" + key + "'");
        }
        seen_.insert(key);
        return *it;
    }

    /// nullptr when the key is absent or null
    const Document* optional(const std::string& key) {
        auto it = doc_.find(key);
        if (it == doc_.end()) {
            return nullptr;
        }
        seen_.insert(key);
        return it->is_null() ? nullptr : &*it;
    }

    std::string path(const std::string& key) const { return path_ + "." + key; }

    std::string string(const std::string& key) { return expect_string(require(key), path(key)); }
    uint64_t count(const std::string& key) { return expect_count(require(key), path(key)); }
    int64_t integer(const std::string& key) { return expect_integer(require(key), path(key)); }

    std::optional<std::string> optional_string(const std::string& key) {
        if (const Document* value = optional(key)) {
            return expect_string(*value, path(key));
        }
        return std::nullopt;
    }

    CategoryCounts counts(const std::string& key) {
        return expect_map<uint64_t>(require(key), path(key), expect_count);
    }

    void finish() const {
        for (const auto& [key, value] : doc_.items()) {
            if (seen_.count(key) == 0) {
                fail(path_, "unexpected field '" + key + "'");
            }
        }
    }

private:
    const Document& doc_;
    std::string path_;
    std::set<std::string> seen_;
};

Document encode_string_list(const std::vector<std::string>& items) {
    Document arr = Document::array();
    for (const auto& item : items) {
        arr.push_back(item);
    }
    return arr;
}

Document encode_string_list_map(const std::map<std::string, std::vector<std::string>>& entries) {
    Document obj = Document::object();
    for (const auto& [key, items] : entries) {
        obj[key] = encode_string_list(items);
    }
    return obj;
}

Document encode_counts(const CategoryCounts& counts) {
    Document obj = Document::object();
    for (const auto& [category, count] : counts) {
        obj[category] = count;
    }
    return obj;
}

Preset read_preset(FieldReader& reader, const std::string& key) {
    return decode_preset(reader.require(key));
}

} // namespace

Document encode_preset(const Preset& preset) {
    Document doc = Document::object();
    doc["preset_id"] = preset.preset_id;
    doc["name"] = preset.name;
    doc["layer"] = preset.layer;
    doc["minimum_confidence"] = preset.minimum_confidence;
    doc["uncertainty_policy"] = preset.uncertainty_policy;
    doc["pseudonym_style"] = preset.pseudonym_style;
    doc["language_mode"] = preset.language_mode;
    // The worker requires the key; null means "not fixed".
    doc["language"] = preset.language ? Document(*preset.language) : Document();

    Document entities = Document::object();
    for (const auto& [category, enabled] : preset.entities_enabled) {
        entities[category] = enabled;
    }
    doc["entities_enabled"] = std::move(entities);

    if (preset.whitelist) {
        doc["whitelist"] = encode_string_list(*preset.whitelist);
    }
    if (preset.blacklist) {
        doc["blacklist"] = encode_string_list(*preset.blacklist);
    }
    if (preset.language_whitelists) {
        doc["language_whitelists"] = encode_string_list_map(*preset.language_whitelists);
    }
    if (preset.language_blacklists) {
        doc["language_blacklists"] = encode_string_list_map(*preset.language_blacklists);
    }
    return doc;
}

Document encode_request(const AnalyzeTextArgs& args) {
    Document doc = Document::object();
    doc["text"] = args.text;
    doc["preset"] = encode_preset(args.preset);
    if (args.model_path) {
        doc["model_path"] = *args.model_path;
    }
    return doc;
}

Document encode_request(const AnalyzeFileArgs& args) {
    Document doc = Document::object();
    doc["input_path"] = args.input_path;
    doc["preset"] = encode_preset(args.preset);
    return doc;
}

Document encode_request(const AnalyzeBatchArgs& args) {
    Document doc = Document::object();
    doc["input_folder"] = args.input_folder;
    doc["preset"] = encode_preset(args.preset);
    doc["recursive"] = args.recursive;
    if (args.language) {
        doc["language"] = *args.language;
    }
    if (args.max_files) {
        doc["max_files"] = *args.max_files;
    }
    if (args.runs_base) {
        doc["runs_base"] = *args.runs_base;
    }
    return doc;
}

Document encode_request(const GetSupportedExtensionsArgs&) {
    return Document::object();
}

Preset decode_preset(const Document& doc) {
    FieldReader reader(doc, "preset");
    Preset preset;
    preset.preset_id = reader.string("preset_id");
    preset.name = reader.string("name");
    preset.layer = reader.integer("layer");
    preset.minimum_confidence = reader.integer("minimum_confidence");
    preset.uncertainty_policy = reader.string("uncertainty_policy");
    preset.pseudonym_style = reader.string("pseudonym_style");
    preset.language_mode = reader.string("language_mode");
    preset.language = reader.optional_string("language");
    preset.entities_enabled =
        expect_map<bool>(reader.require("entities_enabled"), reader.path("entities_enabled"), expect_bool);

    if (const Document* value = reader.optional("whitelist")) {
        preset.whitelist = expect_string_list(*value, reader.path("whitelist"));
    }
    if (const Document* value = reader.optional("blacklist")) {
        preset.blacklist = expect_string_list(*value, reader.path("blacklist"));
    }
    if (const Document* value = reader.optional("language_whitelists")) {
        preset.language_whitelists =
            expect_map<std::vector<std::string>>(*value, reader.path("language_whitelists"), expect_string_list);
    }
    if (const Document* value = reader.optional("language_blacklists")) {
        preset.language_blacklists =
            expect_map<std::vector<std::string>>(*value, reader.path("language_blacklists"), expect_string_list);
    }
    reader.finish();
    return preset;
}

void decode_response(const Document& doc, AnalyzeTextResult& out) {
    FieldReader reader(doc, "analyze_text");
    out.run_id = reader.string("run_id");
    out.run_folder = reader.string("run_folder");
    out.redacted_text = reader.string("redacted_text");
    out.summary = reader.counts("summary");
    out.findings_count = reader.count("findings_count");
    out.language = reader.string("language");
    reader.finish();
}

void decode_response(const Document& doc, AnalyzeFileResult& out) {
    FieldReader reader(doc, "analyze_file");
    out.run_id = reader.string("run_id");
    out.run_folder = reader.string("run_folder");
    out.output_path = reader.string("output_path");
    out.summary = reader.counts("summary");
    out.findings_count = reader.count("findings_count");
    reader.finish();
}

void decode_response(const Document& doc, AnalyzeBatchResult& out) {
    FieldReader reader(doc, "analyze_batch");
    out.run_id = reader.string("run_id");
    out.run_folder = reader.string("run_folder");
    out.processed_files = reader.count("processed_files");
    out.skipped_files = reader.count("skipped_files");
    out.total_files_seen = reader.count("total_files_seen");
    out.summary = reader.counts("summary");
    out.output_folder = reader.string("output_folder");
    reader.finish();
}

void decode_response(const Document& doc, SupportedExtensions& out) {
    FieldReader reader(doc, "get_supported_extensions");
    out.extensions = expect_string_list(reader.require("extensions"), reader.path("extensions"));
    reader.finish();
}

AnalyzeTextArgs decode_analyze_text_args(const Document& host_args) {
    FieldReader reader(host_args, "args");
    AnalyzeTextArgs args;
    args.text = reader.string("text");
    args.preset = read_preset(reader, "preset");
    args.model_path = reader.optional_string("modelPath");
    reader.finish();
    return args;
}

AnalyzeFileArgs decode_analyze_file_args(const Document& host_args) {
    FieldReader reader(host_args, "args");
    AnalyzeFileArgs args;
    args.input_path = reader.string("inputPath");
    args.preset = read_preset(reader, "preset");
    reader.finish();
    return args;
}

AnalyzeBatchArgs decode_analyze_batch_args(const Document& host_args) {
    FieldReader reader(host_args, "args");
    AnalyzeBatchArgs args;
    args.input_folder = reader.string("inputFolder");
    args.preset = read_preset(reader, "preset");
    args.language = reader.optional_string("language");
    if (const Document* value = reader.optional("recursive")) {
        args.recursive = expect_bool(*value, reader.path("recursive"));
    }
    if (const Document* value = reader.optional("maxFiles")) {
        args.max_files = expect_count(*value, reader.path("maxFiles"));
    }
    args.runs_base = reader.optional_string("runsBase");
    reader.finish();
    return args;
}

Document to_document(const AnalyzeTextResult& result) {
    Document doc = Document::object();
    doc["run_id"] = result.run_id;
    doc["run_folder"] = result.run_folder;
    doc["redacted_text"] = result.redacted_text;
    doc["summary"] = encode_counts(result.summary);
    doc["findings_count"] = result.findings_count;
    doc["language"] = result.language;
    return doc;
}

Document to_document(const AnalyzeFileResult& result) {
    Document doc = Document::object();
    doc["run_id"] = result.run_id;
    doc["run_folder"] = result.run_folder;
    doc["output_path"] = result.output_path;
    doc["summary"] = encode_counts(result.summary);
    doc["findings_count"] = result.findings_count;
    return doc;
}

Document to_document(const AnalyzeBatchResult& result) {
    Document doc = Document::object();
    doc["run_id"] = result.run_id;
    doc["run_folder"] = result.run_folder;
    doc["processed_files"] = result.processed_files;
    doc["skipped_files"] = result.skipped_files;
    doc["total_files_seen"] = result.total_files_seen;
    doc["summary"] = encode_counts(result.summary);
    doc["output_folder"] = result.output_folder;
    return doc;
}

Document to_document(const SupportedExtensions& result) {
    Document doc = Document::object();
    doc["extensions"] = encode_string_list(result.extensions);
    return doc;
}

} // namespace sidecar::commands
