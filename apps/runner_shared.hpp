#pragma once

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/storage/run_store.hpp"

#include <filesystem>
#include <memory>
#include <streambuf>
#include <string>

namespace ridge_texture::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Default config when `path` is empty; always validated.
config::Config load_config(const std::string &path);

std::unique_ptr<storage::RunStore> make_run_store(const config::StoreConfig &cfg);

std::filesystem::path events_log_path(const config::StoreConfig &cfg);

} // namespace ridge_texture::runner
