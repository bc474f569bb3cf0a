/**
 * @file sgkdoc_cli.cpp
 * @brief SGK Document Pipeline - command-line front end
 *
 * Runs uploads through the pipeline against a local SQLite store and gives
 * access to the stored documents and patient workflow.
 *
 * Usage:
 *   sgkdoc_cli <command> [arguments] [options]
 *
 * Example:
 *   sgkdoc_cli import-patients patients.json
 *   sgkdoc_cli process scan.jpg --ocr-text scan.txt
 *   sgkdoc_cli list --patient p-001 --format json
 *   sgkdoc_cli assign sgk_doc_1700000000000_abc123xyz p-002
 */

#include "sgkdoc/config/config_loader.hpp"
#include "sgkdoc/integration/logger_adapter.hpp"
#include "sgkdoc/integration/thread_adapter.hpp"
#include "sgkdoc/pipeline/pipeline_orchestrator.hpp"
#include "sgkdoc/storage/document_store.hpp"
#include "sgkdoc/storage/patient_directory.hpp"
#include "sgkdoc/storage/sqlite_database.hpp"
#include "sgkdoc/storage/workflow_status.hpp"
#include <sgkdoc/compat/time.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

using json = nlohmann::json;
namespace fs = std::filesystem;

enum class output_format { text, json };

enum class command_kind { none, process, list, assign, import_patients, status, history, export_pdf };

/**
 * @brief Command line options
 */
struct options {
    command_kind command{command_kind::none};
    std::vector<std::string> arguments;

    fs::path config_path;
    std::string database_path;
    fs::path ocr_text_path;
    std::string patient_filter;
    std::string note;
    output_format format{output_format::text};
    bool verbose{false};
};

void print_usage(const char* program_name) {
    std::cout << R"(
SGK Document Pipeline

Usage: )" << program_name
              << R"( <command> [arguments] [options]

Commands:
  process <file> [file2 ...]        Run uploads through the pipeline
                                    ("process" may be omitted)
  list                              List stored documents
  assign <document-id> <patient-id> Link a document to a patient manually
  import-patients <json-file>       Add or update directory patients
  status <patient-id> <status>      Set a patient's workflow status
  history <patient-id>              Show a patient's workflow history
  export <document-id> <directory>  Write a stored PDF to a directory

Options:
  -h, --help             Show this help message
  -c, --config <file>    JSON configuration file
  --db <file>            SQLite database (overrides the configuration)
  --ocr-text <file>      OCR text for the upload (default: <upload>.txt)
  --patient <id>         Restrict 'list' to one patient
  --note <text>          Note recorded with 'status'
  -f, --format <f>       Output format: text (default), json
  -v, --verbose          Log to the console at debug level

Workflow statuses:
  inquiry_started, prescription_saved, materials_delivered,
  documents_uploaded, invoiced, payment_received
  (pending, approved and paid are accepted as legacy names)

Exit Codes:
  0  Success
  1  Error - Invalid arguments or configuration
  2  Error - Storage could not be opened
  3  Error - One or more operations failed
)";
}

auto parse_command(const std::string& name) -> command_kind {
    if (name == "process") return command_kind::process;
    if (name == "list") return command_kind::list;
    if (name == "assign") return command_kind::assign;
    if (name == "import-patients") return command_kind::import_patients;
    if (name == "status") return command_kind::status;
    if (name == "history") return command_kind::history;
    if (name == "export") return command_kind::export_pdf;
    return command_kind::none;
}

auto required_arguments(command_kind command) -> std::size_t {
    switch (command) {
        case command_kind::process: return 1;
        case command_kind::assign: return 2;
        case command_kind::import_patients: return 1;
        case command_kind::status: return 2;
        case command_kind::history: return 1;
        case command_kind::export_pdf: return 2;
        default: return 0;
    }
}

bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            opts.database_path = argv[++i];
        } else if (arg == "--ocr-text" && i + 1 < argc) {
            opts.ocr_text_path = argv[++i];
        } else if (arg == "--patient" && i + 1 < argc) {
            opts.patient_filter = argv[++i];
        } else if (arg == "--note" && i + 1 < argc) {
            opts.note = argv[++i];
        } else if ((arg == "--format" || arg == "-f") && i + 1 < argc) {
            std::string fmt = argv[++i];
            if (fmt == "json") {
                opts.format = output_format::json;
            } else if (fmt == "text") {
                opts.format = output_format::text;
            } else {
                std::cerr << "Error: Unknown format '" << fmt << "'. Use: text, json\n";
                return false;
            }
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.command == command_kind::none) {
            opts.command = parse_command(arg);
            if (opts.command == command_kind::none) {
                // sgkdoc <file> is shorthand for sgkdoc process <file>
                opts.command = command_kind::process;
                opts.arguments.push_back(arg);
            }
        } else {
            opts.arguments.push_back(arg);
        }
    }

    if (opts.command == command_kind::none) {
        std::cerr << "Error: No command specified\n";
        return false;
    }
    if (opts.arguments.size() < required_arguments(opts.command)) {
        std::cerr << "Error: Missing arguments for command\n";
        return false;
    }
    return true;
}

auto media_type_for(const fs::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".tif" || ext == ".tiff") return "image/tiff";
    if (ext == ".pdf") return "application/pdf";
    return "application/octet-stream";
}

auto read_file(const fs::path& path, std::vector<uint8_t>& out) -> bool {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

auto read_text(const fs::path& path) -> std::string {
    std::ifstream in(path);
    if (!in) {
        return {};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    const auto tm = sgkdoc::compat::to_local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

/**
 * @brief OCR service that answers with text prepared by the operator
 *
 * The CLI has no recognition engine; the text for each upload is read from
 * a sidecar file before the upload is processed.
 */
class prepared_text_ocr final : public sgkdoc::pipeline::ocr_service {
public:
    void set_text(std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = std::move(text);
    }

    auto extract_text(std::span<const uint8_t> /*image_bytes*/)
        -> sgkdoc::Result<sgkdoc::pipeline::ocr_result> override {
        std::lock_guard<std::mutex> lock(mutex_);
        sgkdoc::pipeline::ocr_result result;
        result.text = text_;
        result.confidence = text_.empty() ? 0.0 : 1.0;
        return result;
    }

private:
    std::mutex mutex_;
    std::string text_;
};

class console_progress final : public sgkdoc::pipeline::progress_sink {
public:
    explicit console_progress(bool enabled) : enabled_(enabled) {}

    void on_progress(int step, int total, std::string_view message) override {
        if (enabled_) {
            std::cout << "  [" << step << "/" << total << "] " << message << "\n";
        }
    }

private:
    bool enabled_;
};

auto artifact_to_json(const sgkdoc::storage::document_artifact& a) -> json {
    json j;
    j["id"] = a.id;
    j["run_id"] = a.run_id;
    j["patient_id"] = a.patient_id ? json(*a.patient_id) : json(nullptr);
    j["type"] = std::string(sgkdoc::classification::to_tag(a.type));
    j["filename"] = a.filename;
    j["original_filename"] = a.original_filename;
    j["size"] = a.pdf.size();
    j["original_size"] = a.original_size;
    j["match_tier"] = a.match_tier;
    j["match_confidence"] = a.match_confidence;
    j["classification_confidence"] = a.classification_confidence;
    j["requires_confirmation"] = a.requires_confirmation;
    j["manual_assignment"] = a.manual_assignment;
    j["within_budget"] = a.within_budget;
    j["placeholder"] = a.placeholder;
    j["status"] = a.status ? json(std::string(sgkdoc::storage::to_string(*a.status)))
                           : json(nullptr);
    j["detection_method"] = a.detection_method;
    j["processing_steps"] = a.processing_steps;
    j["created_at"] = format_timestamp(a.created_at);
    return j;
}

void print_artifact(const sgkdoc::storage::document_artifact& a) {
    std::cout << "  " << a.id << "\n"
              << "    File:        " << a.filename << " (" << a.pdf.size() / 1024 << " KB"
              << (a.within_budget ? "" : ", over budget") << (a.placeholder ? ", placeholder" : "")
              << ")\n"
              << "    Type:        " << sgkdoc::classification::display_name(a.type) << " ("
              << std::fixed << std::setprecision(2) << a.classification_confidence << ")\n"
              << "    Patient:     " << a.patient_id.value_or("-") << " [" << a.match_tier
              << " " << a.match_confidence << "]"
              << (a.requires_confirmation ? " confirmation required" : "")
              << (a.manual_assignment ? " manual" : "") << "\n"
              << "    Uploaded:    " << format_timestamp(a.created_at) << "\n";
}

struct application {
    sgkdoc::config::app_config config;
    std::shared_ptr<sgkdoc::storage::sqlite_database> database;
    std::shared_ptr<sgkdoc::storage::sqlite_document_store> store;
    std::shared_ptr<sgkdoc::storage::sqlite_patient_directory> directory;
    std::shared_ptr<prepared_text_ocr> ocr;
    std::unique_ptr<sgkdoc::pipeline::pipeline_orchestrator> orchestrator;
};

int run_process(application& app, const options& opts) {
    int exit_code = 0;
    json results = json::array();

    for (const auto& argument : opts.arguments) {
        const fs::path path(argument);
        sgkdoc::pipeline::uploaded_file file;
        if (!read_file(path, file.bytes)) {
            std::cerr << "Error: Cannot read " << path.string() << "\n";
            exit_code = 3;
            continue;
        }
        file.file_name = path.filename().string();
        file.media_type = media_type_for(path);

        auto text_path = opts.ocr_text_path.empty() ? fs::path(path.string() + ".txt")
                                                    : opts.ocr_text_path;
        app.ocr->set_text(read_text(text_path));

        if (opts.format == output_format::text) {
            std::cout << file.file_name << "\n";
        }
        auto result = app.orchestrator->process(file);
        if (result.is_err()) {
            const auto& err = result.error();
            if (opts.format == output_format::json) {
                results.push_back({{"file", file.file_name},
                                   {"error", err.message},
                                   {"code", err.code}});
            } else {
                std::cerr << "  Error: " << err.message << " (" << err.code << ")\n";
            }
            exit_code = 3;
            continue;
        }

        const auto& run = result.value();
        if (opts.format == output_format::json) {
            auto entry = artifact_to_json(run.artifact);
            entry["replayed"] = run.replayed;
            entry["compression_attempts"] = run.compression_attempts.size();
            results.push_back(entry);
        } else {
            print_artifact(run.artifact);
        }
    }

    if (opts.format == output_format::json) {
        std::cout << results.dump(2) << "\n";
    }
    return exit_code;
}

int run_list(application& app, const options& opts) {
    std::optional<std::string_view> filter;
    if (!opts.patient_filter.empty()) {
        filter = opts.patient_filter;
    }
    auto listed = app.store->list(filter);
    if (listed.is_err()) {
        std::cerr << "Error: " << listed.error().message << "\n";
        return 3;
    }

    if (opts.format == output_format::json) {
        json out = json::array();
        for (const auto& a : listed.value()) {
            out.push_back(artifact_to_json(a));
        }
        std::cout << out.dump(2) << "\n";
    } else {
        std::cout << listed.value().size() << " document(s)\n";
        for (const auto& a : listed.value()) {
            print_artifact(a);
        }
    }
    return 0;
}

int run_assign(application& app, const options& opts) {
    auto assigned = app.orchestrator->assign_patient(opts.arguments[0], opts.arguments[1]);
    if (assigned.is_err()) {
        std::cerr << "Error: " << assigned.error().message << "\n";
        return 3;
    }
    if (opts.format == output_format::json) {
        std::cout << artifact_to_json(assigned.value()).dump(2) << "\n";
    } else {
        print_artifact(assigned.value());
    }
    return 0;
}

int run_import_patients(application& app, const options& opts) {
    json doc;
    try {
        doc = json::parse(read_text(opts.arguments[0]));
    } catch (const json::exception& e) {
        std::cerr << "Error: Invalid patient file: " << e.what() << "\n";
        return 1;
    }
    if (!doc.is_array()) {
        std::cerr << "Error: Patient file must hold a JSON array\n";
        return 1;
    }

    std::size_t imported = 0;
    for (const auto& entry : doc) {
        sgkdoc::patient p;
        try {
            p.id = entry.at("id").get<std::string>();
            p.name = entry.at("name").get<std::string>();
            p.tc_number = entry.value("tc_number", std::string{});
            p.birth_date = entry.value("birth_date", std::string{});
            p.phone = entry.value("phone", std::string{});
        } catch (const json::exception& e) {
            std::cerr << "Error: Skipping patient entry: " << e.what() << "\n";
            continue;
        }
        auto stored = app.directory->upsert(p);
        if (stored.is_err()) {
            std::cerr << "Error: " << p.id << ": " << stored.error().message << "\n";
            continue;
        }
        ++imported;
    }
    std::cout << imported << " patient(s) imported\n";
    return imported == doc.size() ? 0 : 3;
}

int run_status(application& app, const options& opts) {
    auto status = sgkdoc::storage::parse_workflow_status(opts.arguments[1]);
    if (!status) {
        std::cerr << "Error: Unknown workflow status '" << opts.arguments[1] << "'\n";
        return 1;
    }
    auto updated = app.directory->set_workflow_status(opts.arguments[0], *status, opts.note);
    if (updated.is_err()) {
        std::cerr << "Error: " << updated.error().message << "\n";
        return 3;
    }
    auto documents = app.store->update_workflow_for_patient(opts.arguments[0], *status);
    if (documents.is_err()) {
        std::cerr << "Error: " << documents.error().message << "\n";
        return 3;
    }
    sgkdoc::integration::logger_adapter::log_workflow_status_changed(
        opts.arguments[0], std::string(sgkdoc::storage::to_string(*status)), opts.note);

    std::cout << opts.arguments[0] << ": " << sgkdoc::storage::workflow_label(*status) << " ("
              << documents.value() << " document(s) updated)\n";
    auto next = sgkdoc::storage::next_actions(*status);
    if (!next.empty()) {
        std::cout << "  Next: " << sgkdoc::storage::workflow_label(next.front()) << "\n";
    }
    return 0;
}

int run_history(application& app, const options& opts) {
    auto history = app.directory->status_history(opts.arguments[0]);
    if (history.is_err()) {
        std::cerr << "Error: " << history.error().message << "\n";
        return 3;
    }
    if (opts.format == output_format::json) {
        json out = json::array();
        for (const auto& e : history.value()) {
            out.push_back({{"status", std::string(sgkdoc::storage::to_string(e.status))},
                           {"label", e.label},
                           {"notes", e.notes},
                           {"changed_at", format_timestamp(e.changed_at)}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    for (const auto& e : history.value()) {
        std::cout << "  " << format_timestamp(e.changed_at) << "  " << e.label
                  << (e.notes.empty() ? "" : "  - " + e.notes) << "\n";
    }
    return 0;
}

int run_export(application& app, const options& opts) {
    auto found = app.store->find(opts.arguments[0]);
    if (found.is_err()) {
        std::cerr << "Error: " << found.error().message << "\n";
        return 3;
    }
    const auto& artifact = found.value();
    if (!artifact) {
        std::cerr << "Error: Document not found: " << opts.arguments[0] << "\n";
        return 3;
    }
    std::error_code ec;
    fs::create_directories(opts.arguments[1], ec);
    const auto target = fs::path(opts.arguments[1]) / artifact->filename;
    std::ofstream out(target, std::ios::binary);
    out.write(reinterpret_cast<const char*>(artifact->pdf.data()),
              static_cast<std::streamsize>(artifact->pdf.size()));
    if (!out) {
        std::cerr << "Error: Cannot write " << target.string() << "\n";
        return 3;
    }
    std::cout << target.string() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;
    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    application app;
    if (!opts.config_path.empty()) {
        auto loaded = sgkdoc::config::config_loader::load_file(opts.config_path);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return 1;
        }
        app.config = loaded.value();
    }
    if (auto env = sgkdoc::config::config_loader::apply_environment(app.config); env.is_err()) {
        std::cerr << "Error: " << env.error().message << "\n";
        return 1;
    }
    if (!opts.database_path.empty()) {
        app.config.storage.database_path = opts.database_path;
    }
    if (opts.verbose) {
        app.config.logging.enable_console = true;
        app.config.logging.min_level = sgkdoc::integration::log_level::debug;
    }

    sgkdoc::integration::logger_adapter::initialize(app.config.logging);
    sgkdoc::integration::thread_adapter::configure(app.config.workers);

    auto opened = sgkdoc::storage::sqlite_database::open(app.config.storage.database_path,
                                                         app.config.storage.database);
    if (opened.is_err()) {
        std::cerr << "Error: " << opened.error().message << "\n";
        sgkdoc::integration::logger_adapter::shutdown();
        return 2;
    }
    app.database = opened.value();
    app.store = std::make_shared<sgkdoc::storage::sqlite_document_store>(app.database);
    app.directory = std::make_shared<sgkdoc::storage::sqlite_patient_directory>(app.database);
    app.ocr = std::make_shared<prepared_text_ocr>();

    sgkdoc::pipeline::pipeline_dependencies deps;
    deps.ocr = app.ocr;
    deps.directory = app.directory;
    deps.store = app.store;
    deps.progress =
        std::make_shared<console_progress>(opts.format == output_format::text && opts.verbose);
    deps.logger = std::make_shared<sgkdoc::di::LoggerService>("pipeline");

    sgkdoc::pipeline::orchestrator_config orchestration;
    orchestration.pipeline = app.config.pipeline;
    orchestration.rectifier = app.config.rectifier;
    orchestration.resolver = app.config.resolver;
    orchestration.packager = app.config.packager;
    app.orchestrator =
        std::make_unique<sgkdoc::pipeline::pipeline_orchestrator>(deps, orchestration);

    sgkdoc::integration::logger_adapter::info("sgkdoc_cli started (database {})",
                                              app.config.storage.database_path);

    int exit_code = 0;
    switch (opts.command) {
        case command_kind::process: exit_code = run_process(app, opts); break;
        case command_kind::list: exit_code = run_list(app, opts); break;
        case command_kind::assign: exit_code = run_assign(app, opts); break;
        case command_kind::import_patients: exit_code = run_import_patients(app, opts); break;
        case command_kind::status: exit_code = run_status(app, opts); break;
        case command_kind::history: exit_code = run_history(app, opts); break;
        case command_kind::export_pdf: exit_code = run_export(app, opts); break;
        case command_kind::none: break;
    }

    app.orchestrator.reset();
    sgkdoc::integration::thread_adapter::shutdown();
    sgkdoc::integration::logger_adapter::shutdown();
    return exit_code;
}
