#include "runner_shared.hpp"

namespace ridge_texture::runner {

namespace fs = std::filesystem;

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

config::Config load_config(const std::string &path) {
  config::Config cfg = path.empty() ? config::Config{} : config::Config::load(path);
  cfg.validate();
  return cfg;
}

std::unique_ptr<storage::RunStore> make_run_store(const config::StoreConfig &cfg) {
  if (cfg.backend == "memory") {
    return std::make_unique<storage::MemoryRunStore>();
  }
  return std::make_unique<storage::FileRunStore>(cfg.runs_dir);
}

fs::path events_log_path(const config::StoreConfig &cfg) {
  return fs::path(cfg.runs_dir) / "logs" / "events.jsonl";
}

} // namespace ridge_texture::runner
