#include "prism/comparison.hpp"

#include "prism/consts.hpp"
#include "prism/line_diff.hpp"
#include "prism/repo.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_map>

namespace prism {

namespace {

using linediff::Op;

bool is_tracked_blob(std::uint32_t mode) {
  return (mode & consts::kModeTypeMask) != consts::kModeGitlink;
}

std::uint32_t mode_class(std::uint32_t mode) { return mode & consts::kModeTypeMask; }

// 100644 and 100755 alike
bool is_regular(std::uint32_t mode) {
  return mode_class(mode) == (consts::kModeFile & consts::kModeTypeMask);
}

std::string_view view_of(const std::vector<std::uint8_t> &bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

bool starts_section(std::string_view line) {
  if (line.empty())
    return false;
  const auto c = static_cast<unsigned char>(line.front());
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

// Nearest preceding line that looks like a function or block heading.
std::string section_heading(const std::vector<std::string_view> &lines, std::size_t before) {
  for (std::size_t i = before; i-- > 0;) {
    std::string_view line = lines[i];
    if (!starts_section(line))
      continue;
    while (!line.empty() && (line.back() == consts::kLF || line.back() == consts::kCR))
      line.remove_suffix(1);
    if (line.size() > consts::kSectionMaxLen) {
      std::size_t cut = consts::kSectionMaxLen;
      while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80)
        --cut;
      line = line.substr(0, cut);
    }
    return std::string(line);
  }
  return {};
}

LineOrigin eofnl_marker(Op op) {
  switch (op) {
  case Op::Equal:
    return LineOrigin::ContextEofnl;
  case Op::Insert:
    return LineOrigin::AddEofnl;
  case Op::Delete:
    break;
  }
  return LineOrigin::DelEofnl;
}

} // namespace

bool looks_binary(const std::vector<std::uint8_t> &bytes) {
  const std::size_t n = std::min(bytes.size(), consts::kBinarySniffLen);
  return std::find(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(n),
                   static_cast<std::uint8_t>(consts::kNul)) != bytes.begin() + static_cast<std::ptrdiff_t>(n);
}

unsigned similarity_score(const std::vector<std::uint8_t> &a, const std::vector<std::uint8_t> &b) {
  if (a == b)
    return 100;
  if (looks_binary(a) || looks_binary(b))
    return 0;

  const auto a_lines = linediff::split_lines(view_of(a));
  const auto b_lines = linediff::split_lines(view_of(b));
  std::unordered_map<std::string_view, std::size_t> counts;
  for (auto line : a_lines)
    ++counts[line];

  std::size_t shared = 0;
  for (auto line : b_lines) {
    auto it = counts.find(line);
    if (it != counts.end() && it->second > 0) {
      --it->second;
      shared += line.size();
    }
  }
  const std::size_t larger = std::max(a.size(), b.size());
  const auto score = static_cast<unsigned>(shared * 100 / larger);
  return std::min(score, 99u); // only identical content scores 100
}

ComparisonStream::ComparisonStream(const Repository &repo,
                                   const std::optional<std::string> &base_tree,
                                   const std::string &head_tree, DiffOptions options)
    : repo_(repo), options_(options) {
  worktree::PathEntryMap base;
  if (base_tree)
    base = worktree::tree_to_map(repo_, *base_tree);
  const worktree::PathEntryMap head = worktree::tree_to_map(repo_, head_tree);

  for (const auto &[path, entry] : base) {
    if (!is_tracked_blob(entry.mode))
      continue;
    auto it = head.find(path);
    if (it == head.end() || !is_tracked_blob(it->second.mode)) {
      deltas_.push_back({DeltaKind::Deleted, path, path, entry, std::nullopt});
      continue;
    }
    DeltaKind kind = DeltaKind::Unmodified;
    if (mode_class(entry.mode) != mode_class(it->second.mode))
      kind = DeltaKind::TypeChange;
    else if (entry.hex != it->second.hex || entry.mode != it->second.mode)
      kind = DeltaKind::Modified;
    deltas_.push_back({kind, path, path, entry, it->second});
  }
  for (const auto &[path, entry] : head) {
    if (!is_tracked_blob(entry.mode))
      continue;
    auto it = base.find(path);
    if (it == base.end() || !is_tracked_blob(it->second.mode))
      deltas_.push_back({DeltaKind::Added, path, path, std::nullopt, entry});
  }

  find_similar();

  std::erase_if(deltas_, [](const Delta &d) { return d.kind == DeltaKind::Unmodified; });
  std::stable_sort(deltas_.begin(), deltas_.end(), [](const Delta &x, const Delta &y) {
    return x.new_path < y.new_path;
  });
}

const std::vector<std::uint8_t> &ComparisonStream::blob(const std::string &hex) {
  auto it = blob_cache_.find(hex);
  if (it == blob_cache_.end())
    it = blob_cache_.emplace(hex, repo_.read_blob(hex)).first;
  return it->second;
}

void ComparisonStream::find_similar() {
  if (!options_.find_renames && !options_.find_copies)
    return;

  std::vector<std::size_t> targets;
  for (std::size_t i = 0; i < deltas_.size(); ++i)
    if (deltas_[i].kind == DeltaKind::Added)
      targets.push_back(i);
  if (targets.empty())
    return;

  // Rename sources: deleted paths, plus modified paths rewritten past recognition.
  std::vector<std::size_t> rename_sources;
  std::vector<std::size_t> copy_sources;
  for (std::size_t i = 0; i < deltas_.size(); ++i) {
    const Delta &d = deltas_[i];
    if (d.kind == DeltaKind::Deleted) {
      rename_sources.push_back(i);
    } else if (d.kind == DeltaKind::Modified || d.kind == DeltaKind::Unmodified) {
      copy_sources.push_back(i);
      if (d.kind == DeltaKind::Modified && options_.find_renames &&
          similarity_score(blob(d.old_entry->hex), blob(d.new_entry->hex)) <
              consts::kRewriteThreshold)
        rename_sources.push_back(i);
    }
  }

  std::vector<bool> consumed(deltas_.size(), false);
  std::vector<bool> removed(deltas_.size(), false);

  for (std::size_t t : targets) {
    Delta &target = deltas_[t];
    const auto &new_bytes = blob(target.new_entry->hex);

    auto best_match = [&](const std::vector<std::size_t> &sources, unsigned threshold,
                          bool skip_consumed) -> std::optional<std::size_t> {
      std::optional<std::size_t> best;
      unsigned best_score = 0;
      for (std::size_t s : sources) {
        if (skip_consumed && consumed[s])
          continue;
        const auto &src = *deltas_[s].old_entry;
        if (mode_class(src.mode) != mode_class(target.new_entry->mode))
          continue;
        const unsigned score =
            src.hex == target.new_entry->hex ? 100u : similarity_score(blob(src.hex), new_bytes);
        if (score >= threshold && (!best || score > best_score)) {
          best = s;
          best_score = score;
        }
      }
      return best;
    };

    if (options_.find_renames) {
      if (auto s = best_match(rename_sources, options_.rename_threshold, true)) {
        consumed[*s] = true;
        if (deltas_[*s].kind == DeltaKind::Deleted)
          removed[*s] = true;
        target.kind = DeltaKind::Renamed;
        target.old_path = deltas_[*s].old_path;
        target.old_entry = deltas_[*s].old_entry;
        continue;
      }
    }
    if (options_.find_copies) {
      if (auto s = best_match(copy_sources, options_.copy_threshold, false)) {
        target.kind = DeltaKind::Copied;
        target.old_path = deltas_[*s].old_path;
        target.old_entry = deltas_[*s].old_entry;
      }
    }
  }

  std::vector<Delta> kept;
  kept.reserve(deltas_.size());
  for (std::size_t i = 0; i < deltas_.size(); ++i)
    if (!removed[i])
      kept.push_back(std::move(deltas_[i]));
  deltas_ = std::move(kept);
}

void ComparisonStream::queue_file_events(const Delta &delta) {
  static const std::vector<std::uint8_t> kEmpty;
  const auto &old_bytes = delta.old_entry ? blob(delta.old_entry->hex) : kEmpty;
  const auto &new_bytes = delta.new_entry ? blob(delta.new_entry->hex) : kEmpty;

  FileStarted started{.kind = delta.kind,
                      .old_path = delta.old_path,
                      .new_path = delta.new_path,
                      .old_binary = false,
                      .new_binary = false};
  if (delta.old_entry && is_regular(delta.old_entry->mode))
    started.old_binary = looks_binary(old_bytes);
  if (delta.new_entry && is_regular(delta.new_entry->mode))
    started.new_binary = looks_binary(new_bytes);
  pending_.emplace_back(started);

  if (started.old_binary || started.new_binary) {
    pending_.emplace_back(BinaryDetected{});
    return;
  }
  if (old_bytes == new_bytes)
    return;

  const auto a = linediff::split_lines(view_of(old_bytes));
  const auto b = linediff::split_lines(view_of(new_bytes));
  for (const auto &hunk : linediff::make_hunks(a, b, options_.context_lines,
                                               options_.interhunk_lines)) {
    std::string header = linediff::hunk_header(hunk);
    const std::string section =
        hunk.edits.empty() ? std::string{} : section_heading(a, hunk.edits.front().old_index);
    if (!section.empty()) {
      header.push_back(consts::kSpace);
      header += section;
    }
    header.push_back(consts::kLF);
    pending_.emplace_back(HunkStarted{.old_start = hunk.old_start,
                                      .old_lines = hunk.old_lines,
                                      .new_start = hunk.new_start,
                                      .new_lines = hunk.new_lines,
                                      .header = std::move(header)});

    for (const auto &edit : hunk.edits) {
      LineEvent ev;
      std::string_view raw;
      switch (edit.op) {
      case Op::Equal:
        ev.origin = LineOrigin::Context;
        ev.old_lineno = static_cast<std::uint32_t>(edit.old_index + 1);
        ev.new_lineno = static_cast<std::uint32_t>(edit.new_index + 1);
        raw = a[edit.old_index];
        break;
      case Op::Delete:
        ev.origin = LineOrigin::Deletion;
        ev.old_lineno = static_cast<std::uint32_t>(edit.old_index + 1);
        raw = a[edit.old_index];
        break;
      case Op::Insert:
        ev.origin = LineOrigin::Addition;
        ev.new_lineno = static_cast<std::uint32_t>(edit.new_index + 1);
        raw = b[edit.new_index];
        break;
      }
      ev.content.assign(raw);
      const bool missing_newline = raw.empty() || raw.back() != consts::kLF;
      pending_.emplace_back(std::move(ev));
      if (missing_newline)
        pending_.emplace_back(LineEvent{.origin = eofnl_marker(edit.op),
                                        .content = "\n\\ No newline at end of file\n",
                                        .old_lineno = std::nullopt,
                                        .new_lineno = std::nullopt});
    }
  }
}

std::optional<DiffEvent> ComparisonStream::next() {
  while (pending_.empty()) {
    if (next_delta_ >= deltas_.size())
      return std::nullopt;
    queue_file_events(deltas_[next_delta_++]);
  }
  DiffEvent ev = std::move(pending_.front());
  pending_.pop_front();
  return ev;
}

} // namespace prism
