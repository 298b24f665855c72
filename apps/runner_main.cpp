#include "runner_shared.hpp"

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/cancellation.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/events.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/io/image_codec.hpp"
#include "ridge_texture/run/image_source.hpp"
#include "ridge_texture/run/orchestrator.hpp"
#include "ridge_texture/run/run_record.hpp"
#include "ridge_texture/run/synthesis_profile.hpp"
#include "ridge_texture/services/notifier.hpp"
#include "ridge_texture/services/oracle.hpp"
#include "ridge_texture/storage/blob_store.hpp"
#include "ridge_texture/storage/run_store.hpp"

#include <QCoreApplication>

#include <CLI/CLI.hpp>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

namespace config = ridge_texture::config;
namespace core = ridge_texture::core;
namespace io = ridge_texture::io;
namespace run = ridge_texture::run;
namespace runner = ridge_texture::runner;
namespace services = ridge_texture::services;
namespace storage = ridge_texture::storage;

using json = nlohmann::json;

core::CancelToken g_cancel;

void on_sigint(int) { g_cancel.request_stop(); }

struct RunArgs {
  std::string input;
  std::string case_id;
  std::string sample_id;
  std::string output;
  uint64_t seed = 0;
  bool no_oracle = false;
  bool no_notify = false;
};

std::optional<std::string> opt(const std::string &s) {
  return s.empty() ? std::nullopt : std::optional<std::string>(s);
}

// Services and stores shared by the processing commands.
class Runtime {
public:
  explicit Runtime(const config::Config &cfg)
      : cfg_(cfg), store_(runner::make_run_store(cfg.store)),
        blobs_(cfg.storage.blob_root, cfg.storage.public_base_url),
        source_(cfg.storage.blob_root) {
    const fs::path log_path = runner::events_log_path(cfg.store);
    fs::create_directories(log_path.parent_path());
    event_log_file_.open(log_path, std::ios::app);
    if (!event_log_file_) {
      throw ridge_texture::IOError("cannot open events log file: " + log_path.string());
    }
    tee_buf_ = std::make_unique<runner::TeeBuf>(std::cout.rdbuf(), event_log_file_.rdbuf());
    events_out_ = std::make_unique<std::ostream>(tee_buf_.get());

    std::shared_ptr<services::QualityOracle> oracle;
    if (cfg.oracle.enabled) {
      oracle = std::make_shared<services::HttpQualityOracle>(cfg.oracle);
    }
    std::shared_ptr<services::Notifier> notifier;
    if (cfg.notifier.enabled) {
      notifier = std::make_shared<services::HttpNotifier>(cfg.notifier);
    }
    orchestrator_ = std::make_unique<run::RunOrchestrator>(
        cfg_, *store_, blobs_, source_, oracle, notifier, emitter_, *events_out_, std::cerr);
  }

  run::RunOrchestrator &orchestrator() { return *orchestrator_; }
  storage::RunStore &store() { return *store_; }
  storage::LocalBlobStore &blobs() { return blobs_; }

private:
  const config::Config &cfg_;
  std::unique_ptr<storage::RunStore> store_;
  storage::LocalBlobStore blobs_;
  run::FileImageSource source_;
  core::EventEmitter emitter_;
  std::ofstream event_log_file_;
  std::unique_ptr<runner::TeeBuf> tee_buf_;
  std::unique_ptr<std::ostream> events_out_;
  std::unique_ptr<run::RunOrchestrator> orchestrator_;
};

run::RunRequest make_request(const RunArgs &args) {
  run::RunRequest req;
  req.source_ref = args.input;
  req.case_id = opt(args.case_id);
  req.sample_id = opt(args.sample_id);
  req.enable_oracle = !args.no_oracle;
  req.send_notification = !args.no_notify;
  if (args.seed != 0) req.seed = args.seed;
  return req;
}

int print_outcome(const run::RunOutcome &outcome, const std::string &output) {
  if (!output.empty() && !outcome.png.empty()) {
    core::write_bytes(output, outcome.png);
    std::cerr << "Wrote " << output << std::endl;
  }
  json j = outcome.record;
  j["persisted"] = outcome.persisted;
  std::cout << j.dump(2) << std::endl;
  return outcome.record.status == ridge_texture::RunStatus::Completed ? 0 : 1;
}

int run_command(const config::Config &cfg, const RunArgs &args) {
  Runtime rt(cfg);
  const run::RunOutcome outcome = rt.orchestrator().submit(make_request(args), &g_cancel);
  return print_outcome(outcome, args.output);
}

int enqueue_command(const config::Config &cfg, const RunArgs &args) {
  Runtime rt(cfg);
  const run::ProcessingRun record = rt.orchestrator().enqueue(make_request(args));
  std::cout << json(record).dump(2) << std::endl;
  return 0;
}

int process_command(const config::Config &cfg, const std::string &run_id,
                    const std::string &output) {
  Runtime rt(cfg);
  const run::RunOutcome outcome = rt.orchestrator().claim(run_id, &g_cancel);
  return print_outcome(outcome, output);
}

int history_command(const config::Config &cfg, const storage::ListQuery &query) {
  auto store = runner::make_run_store(cfg.store);
  json items = json::array();
  for (const auto &r : store->list(query)) {
    items.push_back(json(r));
  }
  std::cout << json{{"items", items}, {"limit", query.limit}, {"offset", query.offset}}.dump(2)
            << std::endl;
  return 0;
}

int show_command(const config::Config &cfg, const std::string &run_id) {
  auto store = runner::make_run_store(cfg.store);
  const auto record = store->get(run_id);
  if (!record) {
    std::cerr << "Error: run not found: " << run_id << std::endl;
    return 1;
  }
  std::cout << json(*record).dump(2) << std::endl;
  return 0;
}

int delete_command(const config::Config &cfg, const std::string &run_id) {
  auto store = runner::make_run_store(cfg.store);
  const bool removed = store->remove(run_id);
  std::cout << json{{"id", run_id}, {"success", removed}}.dump(2) << std::endl;
  return removed ? 0 : 1;
}

int upload_command(const config::Config &cfg, const RunArgs &args) {
  const std::vector<uint8_t> bytes = core::read_bytes(args.input);
  // Reject anything the pipeline could not decode later.
  const auto img = io::decode_image(bytes);
  storage::LocalBlobStore blobs(cfg.storage.blob_root, cfg.storage.public_base_url);
  const std::string filename = fs::path(args.input).filename().string();
  const storage::BlobRef ref =
      blobs.put(storage::make_forensic_key("original", filename, args.case_id, args.sample_id),
                bytes, io::content_type_for(args.input));
  std::cout << json{{"key", ref.key},
                    {"url", ref.url},
                    {"width", img.width},
                    {"height", img.height},
                    {"sizeBytes", bytes.size()},
                    {"sha256", core::sha256_bytes(bytes)}}
                   .dump(2)
            << std::endl;
  return 0;
}

void add_run_options(CLI::App *cmd, RunArgs &args) {
  cmd->add_option("--case", args.case_id, "Case identifier");
  cmd->add_option("--sample", args.sample_id, "Sample identifier");
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qapp(argc, argv);  // needed for Qt6::Network event loop

  CLI::App app{"Ridge Texture Runner"};
  app.require_subcommand(1);

  std::string config_path;
  app.add_option("--config", config_path, "Path to config.yaml");

  RunArgs args;
  std::string run_id;
  std::string output;
  storage::ListQuery query;
  std::string status_filter;
  std::string case_filter;

  auto run_cmd = app.add_subcommand("run", "Process one fingerprint image");
  run_cmd->add_option("--input", args.input, "Image path or blob key")->required();
  run_cmd->add_option("--output", args.output, "Also write the processed PNG here");
  run_cmd->add_option("--seed", args.seed, "Noise seed (0 = config or random)");
  run_cmd->add_flag("--no-oracle", args.no_oracle, "Skip the quality oracle");
  run_cmd->add_flag("--no-notify", args.no_notify, "Skip the owner notification");
  add_run_options(run_cmd, args);

  auto enqueue_cmd = app.add_subcommand("enqueue", "Store a pending run");
  enqueue_cmd->add_option("--input", args.input, "Image path or blob key")->required();
  enqueue_cmd->add_option("--seed", args.seed, "Noise seed (0 = config or random)");
  add_run_options(enqueue_cmd, args);

  auto process_cmd = app.add_subcommand("process", "Process a pending run");
  process_cmd->add_option("--id", run_id, "Run id")->required();
  process_cmd->add_option("--output", output, "Also write the processed PNG here");

  auto history_cmd = app.add_subcommand("history", "List runs, newest first");
  history_cmd->add_option("--limit", query.limit, "1..100")->default_val(20);
  history_cmd->add_option("--offset", query.offset, ">= 0")->default_val(0);
  history_cmd->add_option("--status", status_filter, "pending|processing|completed|failed");
  history_cmd->add_option("--case", case_filter, "Case identifier");

  auto show_cmd = app.add_subcommand("show", "Print one run record");
  show_cmd->add_option("--id", run_id, "Run id")->required();

  auto delete_cmd = app.add_subcommand("delete", "Delete one run record");
  delete_cmd->add_option("--id", run_id, "Run id")->required();

  auto upload_cmd = app.add_subcommand("upload", "Store an original image in the blob store");
  upload_cmd->add_option("--input", args.input, "Image path")->required();
  add_run_options(upload_cmd, args);

  auto profile_cmd = app.add_subcommand("profile", "Describe the synthesis profile");
  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  std::signal(SIGINT, on_sigint);

  try {
    if (schema_cmd->parsed()) {
      std::cout << config::get_schema_json() << std::endl;
      return 0;
    }

    const config::Config cfg = runner::load_config(config_path);

    if (run_cmd->parsed()) return run_command(cfg, args);
    if (enqueue_cmd->parsed()) return enqueue_command(cfg, args);
    if (process_cmd->parsed()) return process_command(cfg, run_id, output);
    if (history_cmd->parsed()) {
      if (!status_filter.empty()) {
        ridge_texture::RunStatus s;
        if (!ridge_texture::string_to_run_status(status_filter, s)) {
          std::cerr << "Error: unknown status '" << status_filter << "'" << std::endl;
          return 2;
        }
        query.status = s;
      }
      query.case_id = opt(case_filter);
      return history_command(cfg, query);
    }
    if (show_cmd->parsed()) return show_command(cfg, run_id);
    if (delete_cmd->parsed()) return delete_command(cfg, run_id);
    if (upload_cmd->parsed()) return upload_command(cfg, args);
    if (profile_cmd->parsed()) {
      std::cout << run::profile_to_json(run::synthesis_profile(cfg)).dump(2) << std::endl;
      return 0;
    }
  } catch (const ridge_texture::RidgeTextureError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
