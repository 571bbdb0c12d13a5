#include "FileDiscoverer.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

std::string normalize_extension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
  return ext;
}

FileDiscoverer::FileDiscoverer(const std::string& root,
                               const std::vector<std::string>& extensions,
                               bool recursive,
                               CancellationToken token)
  : recursive_(recursive), token_(std::move(token)) {
  std::error_code ec;
  root_ = fs::weakly_canonical(fs::absolute(root, ec), ec);
  if (ec) root_ = fs::path(root).lexically_normal();

  for (const auto& e : extensions) {
    auto n = normalize_extension(e);
    if (n.size() > 1 && std::find(extensions_.begin(), extensions_.end(), n) == extensions_.end()) {
      extensions_.push_back(std::move(n));
    }
  }
}

void FileDiscoverer::restart() {
  started_ = false;
  finished_ = false;
  warning_.reset();
  rit_ = fs::recursive_directory_iterator();
  it_ = fs::directory_iterator();
}

bool FileDiscoverer::matches(const fs::path& p) const {
  return std::find(extensions_.begin(), extensions_.end(),
                   normalize_extension(p.extension().string())) != extensions_.end();
}

void FileDiscoverer::fail(const std::string& what, const std::error_code& ec) {
  finished_ = true;
  warning_ = what + " " + root_.string() + ": " + ec.message();
  spdlog::warn("discovery stopped: {}", *warning_);
}

std::optional<std::string> FileDiscoverer::next() {
  if (finished_) return std::nullopt;

  std::error_code ec;
  if (!started_) {
    started_ = true;
    if (recursive_) {
      rit_ = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
    } else {
      it_ = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
    }
    if (ec) { fail("cannot open", ec); return std::nullopt; }
  } else {
    if (recursive_) rit_.increment(ec);
    else it_.increment(ec);
    if (ec) { fail("cannot continue walking", ec); return std::nullopt; }
  }

  for (;;) {
    if (token_.isCancelled()) {
      finished_ = true;
      return std::nullopt;
    }

    const bool atEnd = recursive_ ? rit_ == fs::recursive_directory_iterator()
                                  : it_ == fs::directory_iterator();
    if (atEnd) {
      finished_ = true;
      return std::nullopt;
    }

    const fs::directory_entry& de = recursive_ ? *rit_ : *it_;
    std::error_code typeEc;
    if (de.is_regular_file(typeEc) && !typeEc && matches(de.path())) {
      return de.path().string();
    }

    if (recursive_) rit_.increment(ec);
    else it_.increment(ec);
    if (ec) { fail("cannot continue walking", ec); return std::nullopt; }
  }
}
