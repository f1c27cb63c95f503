#include <gitwebdiff/checksum.hpp>
#include <gitwebdiff/snapshot.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace gitwebdiff {

std::string to_string(PairType t) {
  switch (t) {
  case PairType::Add: return "add";
  case PairType::Delete: return "delete";
  case PairType::Change: return "change";
  case PairType::Move: return "move";
  }
  return "change";
}

Snapshot empty_snapshot() {
  static const Snapshot empty = std::make_shared<const std::vector<FilePair>>();
  return empty;
}

bool is_image_path(const std::string &rel) {
  std::string ext = fs::path(rel).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const char *kImageExts[] = {".png", ".jpg", ".jpeg", ".gif", ".bmp",
                                     ".webp", ".svg", ".ico", ".tif", ".tiff"};
  for (auto *e : kImageExts)
    if (ext == e)
      return true;
  return false;
}

// relative path -> absolute path, regular files only (symlinks followed)
static std::map<std::string, fs::path> list_files(fs::path root) {
  std::map<std::string, fs::path> out;
  root = root.lexically_normal();
  if (root.filename().empty() && root.has_parent_path())
    root = root.parent_path();
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw std::runtime_error("not a directory: " + root.string());

  fs::recursive_directory_iterator it(root, ec), end;
  if (ec)
    throw std::runtime_error("cannot list " + root.string() + ": " + ec.message());
  for (; it != end; it.increment(ec)) {
    if (ec)
      throw std::runtime_error("cannot list " + root.string() + ": " + ec.message());
    std::error_code e2;
    if (!it->is_regular_file(e2))
      continue;
    // lexical: the right tree may hold symlinks into the work tree
    out.emplace(it->path().lexically_relative(root).generic_string(), it->path());
  }
  return out;
}

static std::string read_file(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot read " + p.string());
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool same_content(const fs::path &a, const fs::path &b) {
  if (fs::file_size(a) != fs::file_size(b))
    return false;
  return read_file(a) == read_file(b);
}

static Checksum content_hash(const fs::path &p) {
  auto data = read_file(p);
  return xxh3_128_hex(data.data(), data.size());
}

std::vector<FilePair> DirDiffComputer::compute(const fs::path &left,
                                               const fs::path &right) const {
  auto lfiles = list_files(left);
  auto rfiles = list_files(right);

  std::vector<FilePair> pairs;
  std::vector<std::string> deleted, added;

  for (const auto &[rel, lpath] : lfiles) {
    auto it = rfiles.find(rel);
    if (it == rfiles.end()) {
      deleted.push_back(rel);
      continue;
    }
    if (same_content(lpath, it->second))
      continue;
    FilePair p;
    p.a = rel;
    p.b = rel;
    p.type = PairType::Change;
    p.a_path = lpath;
    p.b_path = it->second;
    pairs.push_back(std::move(p));
  }
  for (const auto &[rel, rpath] : rfiles)
    if (!lfiles.count(rel))
      added.push_back(rel);

  if (opts_.detect_moves && !deleted.empty() && !added.empty()) {
    std::unordered_multimap<Checksum, std::string> by_hash;
    for (const auto &rel : added)
      by_hash.emplace(content_hash(rfiles.at(rel)), rel);

    std::vector<std::string> still_deleted;
    for (const auto &rel : deleted) {
      auto it = by_hash.find(content_hash(lfiles.at(rel)));
      if (it == by_hash.end()) {
        still_deleted.push_back(rel);
        continue;
      }
      FilePair p;
      p.a = rel;
      p.b = it->second;
      p.type = PairType::Move;
      p.a_path = lfiles.at(rel);
      p.b_path = rfiles.at(it->second);
      pairs.push_back(std::move(p));
      added.erase(std::find(added.begin(), added.end(), it->second));
      by_hash.erase(it);
    }
    deleted.swap(still_deleted);
  }

  for (const auto &rel : deleted) {
    FilePair p;
    p.a = rel;
    p.type = PairType::Delete;
    p.a_path = lfiles.at(rel);
    pairs.push_back(std::move(p));
  }
  for (const auto &rel : added) {
    FilePair p;
    p.b = rel;
    p.type = PairType::Add;
    p.b_path = rfiles.at(rel);
    pairs.push_back(std::move(p));
  }

  std::sort(pairs.begin(), pairs.end(), [](const FilePair &x, const FilePair &y) {
    const auto &kx = x.b.empty() ? x.a : x.b;
    const auto &ky = y.b.empty() ? y.a : y.b;
    return kx < ky;
  });

  int idx = 0;
  for (auto &p : pairs) {
    p.idx = idx++;
    std::error_code ec;
    if (!p.a_path.empty())
      p.size_a = fs::file_size(p.a_path, ec);
    if (!p.b_path.empty())
      p.size_b = fs::file_size(p.b_path, ec);
    p.is_image_diff = is_image_path(p.a) || is_image_path(p.b);
  }
  return pairs;
}

} // namespace gitwebdiff
