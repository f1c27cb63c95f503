#pragma once
#include "checksum.hpp"
#include "difftool.hpp"
#include "repo.hpp"
#include "snapshot.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gitwebdiff {

// Everything a reader may look at, published as one immutable record.
struct RepoView {
  std::uint64_t generation = 0;
  std::vector<std::string> comparison_args;
  Snapshot snapshot = empty_snapshot();
  std::optional<Checksum> initial_checksum;
  std::optional<Checksum> current_checksum;

  bool checksums_differ() const {
    return initial_checksum && current_checksum && *initial_checksum != *current_checksum;
  }
};

class RepoState {
public:
  RepoState(RepoDescriptor descriptor, std::vector<std::string> comparison_args);
  ~RepoState();

  RepoState(const RepoState &) = delete;
  RepoState &operator=(const RepoState &) = delete;

  const RepoDescriptor &descriptor() const { return descriptor_; }
  const std::string &label() const { return descriptor_.label; }

  std::shared_ptr<const RepoView> view() const;
  Snapshot snapshot() const { return view()->snapshot; }
  std::vector<std::string> comparison_args() const { return view()->comparison_args; }

  // Replaces args, snapshot and both checksums at once; returns the new generation.
  std::uint64_t publish(std::vector<std::string> args, Snapshot snapshot,
                        std::optional<Checksum> checksum);

  // Watcher path: only current_checksum, and only if no publish happened
  // since `generation` was read. Returns false when the value was dropped.
  bool update_current_checksum(std::uint64_t generation, Checksum checksum);

  // Non-blocking reload gate; owns_lock() == false means a refresh is in flight.
  std::unique_lock<std::mutex> try_begin_reload();
  bool reload_in_flight();

  std::unique_ptr<DifftoolProcess> take_process();
  void install_process(std::unique_ptr<DifftoolProcess> proc);
  bool has_process() const;
  void stop_process();

private:
  const RepoDescriptor descriptor_;

  mutable std::mutex view_mu_;
  std::shared_ptr<const RepoView> view_;

  mutable std::mutex process_mu_;
  std::unique_ptr<DifftoolProcess> process_;

  std::mutex reload_mu_;
};

} // namespace gitwebdiff
