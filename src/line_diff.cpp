#include "prism/line_diff.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace prism::linediff {

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t nl = text.find('\n', start);
    const std::size_t end = nl == std::string_view::npos ? text.size() : nl + 1;
    out.push_back(text.substr(start, end - start));
    start = end;
  }
  return out;
}

namespace {

// Lines are compared through small integer ids.
void intern_lines(const std::vector<std::string_view> &a, const std::vector<std::string_view> &b,
                  std::vector<int> &ida, std::vector<int> &idb) {
  std::unordered_map<std::string_view, int> ids;
  const auto id = [&ids](std::string_view line) {
    return ids.emplace(line, static_cast<int>(ids.size())).first->second;
  };
  ida.reserve(a.size());
  idb.reserve(b.size());
  for (const auto line : a)
    ida.push_back(id(line));
  for (const auto line : b)
    idb.push_back(id(line));
}

// One side of the comparison: line ids plus a changed flag per line. The flag
// vector carries an unchanged sentinel before the first and after the last line.
struct Side {
  const std::vector<std::string_view> &lines;
  const std::vector<int> &ids;
  std::vector<char> flags;

  Side(const std::vector<std::string_view> &l, const std::vector<int> &i)
      : lines(l), ids(i), flags(l.size() + 2, 0) {}

  [[nodiscard]] int size() const { return static_cast<int>(ids.size()); }
  [[nodiscard]] bool changed(int i) const { return flags[static_cast<std::size_t>(i + 1)] != 0; }
  void mark(int i, bool on) { flags[static_cast<std::size_t>(i + 1)] = on ? 1 : 0; }
};

// Linear-space Myers: find the middle snake of the shortest edit script, then
// recurse on both halves. Only the changed flags are recorded.
class Bisector {
public:
  Bisector(Side &a, Side &b) : a_(a), b_(b) {}

  void run(int a0, int a1, int b0, int b1) {
    while (a0 < a1 && b0 < b1 && a_.ids[a0] == b_.ids[b0]) {
      ++a0;
      ++b0;
    }
    while (a0 < a1 && b0 < b1 && a_.ids[a1 - 1] == b_.ids[b1 - 1]) {
      --a1;
      --b1;
    }
    if (a0 == a1 || b0 == b1) {
      mark_all(a0, a1, b0, b1);
      return;
    }
    const auto split = middle(a0, a1, b0, b1);
    if (!split) {
      mark_all(a0, a1, b0, b1);
      return;
    }
    run(a0, a0 + split->first, b0, b0 + split->second);
    run(a0 + split->first, a1, b0 + split->second, b1);
  }

private:
  void mark_all(int a0, int a1, int b0, int b1) {
    for (int i = a0; i < a1; ++i)
      a_.mark(i, true);
    for (int j = b0; j < b1; ++j)
      b_.mark(j, true);
  }

  // Split point (x, y) relative to (a0, b0), on an optimal path where the
  // forward and reverse searches overlap. Both ranges are non-empty and their
  // first and last lines differ.
  [[nodiscard]] std::optional<std::pair<int, int>> middle(int a0, int a1, int b0, int b1) const {
    const int n = a1 - a0;
    const int m = b1 - b0;
    const int max_d = (n + m + 1) / 2;
    const int offset = max_d;
    const int len = 2 * max_d + 2;
    std::vector<int> fwd(static_cast<std::size_t>(len), -1);
    std::vector<int> rev(static_cast<std::size_t>(len), -1);
    fwd[offset + 1] = 0;
    rev[offset + 1] = 0;
    const int delta = n - m;
    const bool odd = delta % 2 != 0;
    int k1start = 0;
    int k1end = 0;
    int k2start = 0;
    int k2end = 0;

    for (int d = 0; d < max_d; ++d) {
      for (int k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
        const int i = offset + k1;
        int x1 = (k1 == -d || (k1 != d && fwd[i - 1] < fwd[i + 1])) ? fwd[i + 1] : fwd[i - 1] + 1;
        int y1 = x1 - k1;
        while (x1 < n && y1 < m && a_.ids[a0 + x1] == b_.ids[b0 + y1]) {
          ++x1;
          ++y1;
        }
        fwd[i] = x1;
        if (x1 > n) {
          k1end += 2;
        } else if (y1 > m) {
          k1start += 2;
        } else if (odd) {
          const int j = offset + delta - k1;
          if (j >= 0 && j < len && rev[j] != -1) {
            const int x2 = rev[j];
            const int y2 = x2 - (j - offset);
            if (x2 <= n && y2 >= 0 && y2 <= m && x1 >= n - x2)
              return std::pair{x1, y1};
          }
        }
      }

      for (int k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
        const int i = offset + k2;
        int x2 = (k2 == -d || (k2 != d && rev[i - 1] < rev[i + 1])) ? rev[i + 1] : rev[i - 1] + 1;
        int y2 = x2 - k2;
        while (x2 < n && y2 < m && a_.ids[a1 - x2 - 1] == b_.ids[b1 - y2 - 1]) {
          ++x2;
          ++y2;
        }
        rev[i] = x2;
        if (x2 > n) {
          k2end += 2;
        } else if (y2 > m) {
          k2start += 2;
        } else if (!odd) {
          const int j = offset + delta - k2;
          if (j >= 0 && j < len && fwd[j] != -1) {
            const int x1 = fwd[j];
            const int y1 = offset + x1 - j;
            // forward entries that ran off the grid are not paths
            if (x1 <= n && y1 >= 0 && y1 <= m && x1 >= n - x2)
              return std::pair{x1, y1};
          }
        }
      }
    }
    return std::nullopt;
  }

  Side &a_;
  Side &b_;
};

// Indentation heuristic, after xdiff's XDF_INDENT_HEURISTIC: a change group
// that can slide over equal lines is placed where the split around it looks
// most like a block boundary.
constexpr int kMaxIndent = 200;
constexpr int kMaxBlanks = 20;
constexpr int kStartOfFilePenalty = 1;
constexpr int kEndOfFilePenalty = 21;
constexpr int kTotalBlankWeight = -30;
constexpr int kPostBlankWeight = 6;
constexpr int kRelativeIndentPenalty = -4;
constexpr int kRelativeIndentWithBlankPenalty = 10;
constexpr int kRelativeOutdentPenalty = 24;
constexpr int kRelativeOutdentWithBlankPenalty = 17;
constexpr int kRelativeDedentPenalty = 23;
constexpr int kRelativeDedentWithBlankPenalty = 17;
constexpr int kIndentWeight = 60;
constexpr int kMaxSliding = 100;

// Width of the leading whitespace (tabs to multiples of 8), -1 for a blank line.
int indent_of(std::string_view line) {
  int ret = 0;
  for (const char c : line) {
    if (c == ' ')
      ret += 1;
    else if (c == '\t')
      ret += 8 - (ret % 8);
    else if (!std::isspace(static_cast<unsigned char>(c)))
      return ret;
    if (ret >= kMaxIndent)
      return kMaxIndent;
  }
  return -1;
}

struct SplitMeasure {
  bool end_of_file = false;
  int indent = -1;
  int pre_blank = 0;
  int pre_indent = -1;
  int post_blank = 0;
  int post_indent = -1;
};

// Surroundings of the split that falls just before line `split`.
SplitMeasure measure_split(const Side &side, int split) {
  SplitMeasure m;
  if (split >= side.size())
    m.end_of_file = true;
  else
    m.indent = indent_of(side.lines[split]);

  for (int i = split - 1; i >= 0; --i) {
    m.pre_indent = indent_of(side.lines[i]);
    if (m.pre_indent != -1)
      break;
    if (++m.pre_blank == kMaxBlanks) {
      m.pre_indent = 0;
      break;
    }
  }
  for (int i = split + 1; i < side.size(); ++i) {
    m.post_indent = indent_of(side.lines[i]);
    if (m.post_indent != -1)
      break;
    if (++m.post_blank == kMaxBlanks) {
      m.post_indent = 0;
      break;
    }
  }
  return m;
}

struct SplitScore {
  int effective_indent = 0;
  int penalty = 0;
};

void add_split(const SplitMeasure &m, SplitScore &s) {
  if (m.pre_indent == -1 && m.pre_blank == 0)
    s.penalty += kStartOfFilePenalty;
  if (m.end_of_file)
    s.penalty += kEndOfFilePenalty;

  const int post_blank = m.indent == -1 ? 1 + m.post_blank : 0;
  const int total_blank = m.pre_blank + post_blank;
  s.penalty += kTotalBlankWeight * total_blank;
  s.penalty += kPostBlankWeight * post_blank;

  const int indent = m.indent != -1 ? m.indent : m.post_indent;
  const bool any_blanks = total_blank != 0;
  s.effective_indent += indent;

  if (indent == -1 || m.pre_indent == -1 || indent == m.pre_indent)
    return;
  if (indent > m.pre_indent)
    s.penalty += any_blanks ? kRelativeIndentWithBlankPenalty : kRelativeIndentPenalty;
  else if (m.post_indent != -1 && m.post_indent > indent)
    s.penalty += any_blanks ? kRelativeOutdentWithBlankPenalty : kRelativeOutdentPenalty;
  else
    s.penalty += any_blanks ? kRelativeDedentWithBlankPenalty : kRelativeDedentPenalty;
}

// Negative when `lhs` is the better split.
int compare_scores(const SplitScore &lhs, const SplitScore &rhs) {
  const int cmp_indents = (lhs.effective_indent > rhs.effective_indent) -
                          (lhs.effective_indent < rhs.effective_indent);
  return kIndentWeight * cmp_indents + (lhs.penalty - rhs.penalty);
}

// A run [start, end) of changed lines; start == end is an empty group.
struct Group {
  int start = 0;
  int end = 0;
};

Group first_group(const Side &side) {
  Group g;
  while (side.changed(g.end))
    ++g.end;
  return g;
}

bool next_group(const Side &side, Group &g) {
  if (g.end == side.size())
    return false;
  g.start = g.end + 1;
  for (g.end = g.start; side.changed(g.end); ++g.end) {
  }
  return true;
}

bool previous_group(const Side &side, Group &g) {
  if (g.start == 0)
    return false;
  g.end = g.start - 1;
  for (g.start = g.end; side.changed(g.start - 1); --g.start) {
  }
  return true;
}

bool slide_down(Side &side, Group &g) {
  if (g.end >= side.size() || side.ids[g.start] != side.ids[g.end])
    return false;
  side.mark(g.start++, false);
  side.mark(g.end++, true);
  while (side.changed(g.end))
    ++g.end;
  return true;
}

bool slide_up(Side &side, Group &g) {
  if (g.start <= 0 || side.ids[g.start - 1] != side.ids[g.end - 1])
    return false;
  side.mark(--g.start, true);
  side.mark(--g.end, false);
  while (side.changed(g.start - 1))
    --g.start;
  return true;
}

void sync(bool moved) {
  if (!moved)
    throw std::runtime_error("line diff: change groups out of sync");
}

// Slide every change group of `side` as far as the equal lines allow, then
// settle it next to a change in `other` or at the best-scoring split.
void compact(Side &side, Side &other) {
  Group g = first_group(side);
  Group go = first_group(other);
  for (;;) {
    if (g.end != g.start) {
      int groupsize = 0;
      int earliest_end = 0;
      int end_matching_other = -1;
      do {
        groupsize = g.end - g.start;
        end_matching_other = -1;
        while (slide_up(side, g))
          sync(previous_group(other, go));
        earliest_end = g.end;
        if (go.end > go.start)
          end_matching_other = g.end;
        while (slide_down(side, g)) {
          sync(next_group(other, go));
          if (go.end > go.start)
            end_matching_other = g.end;
        }
      } while (groupsize != g.end - g.start);

      if (g.end == earliest_end) {
        // fixed in place
      } else if (end_matching_other != -1) {
        while (go.end == go.start) {
          sync(slide_up(side, g));
          sync(previous_group(other, go));
        }
      } else {
        int shift = std::max({earliest_end, g.end - groupsize - 1, g.end - kMaxSliding});
        int best_shift = -1;
        SplitScore best;
        for (; shift <= g.end; ++shift) {
          SplitScore score;
          add_split(measure_split(side, shift), score);
          add_split(measure_split(side, shift - groupsize), score);
          if (best_shift == -1 || compare_scores(score, best) <= 0) {
            best = score;
            best_shift = shift;
          }
        }
        while (g.end > best_shift) {
          sync(slide_up(side, g));
          sync(previous_group(other, go));
        }
      }
    }
    if (!next_group(side, g))
      break;
    sync(next_group(other, go));
  }
}

std::string format_range(std::uint32_t start, std::uint32_t len) {
  if (len == 1)
    return std::to_string(start);
  return std::to_string(start) + "," + std::to_string(len);
}

} // namespace

std::vector<Op> myers_diff(const std::vector<std::string_view> &a,
                           const std::vector<std::string_view> &b) {
  std::vector<int> ida;
  std::vector<int> idb;
  intern_lines(a, b, ida, idb);
  Side old_side{a, ida};
  Side new_side{b, idb};

  Bisector{old_side, new_side}.run(0, old_side.size(), 0, new_side.size());
  compact(old_side, new_side);
  compact(new_side, old_side);

  std::vector<Op> ops;
  ops.reserve(a.size() + b.size());
  int i = 0;
  int j = 0;
  while (i < old_side.size() || j < new_side.size()) {
    if (i < old_side.size() && old_side.changed(i)) {
      ops.push_back(Op::Delete);
      ++i;
    } else if (j < new_side.size() && new_side.changed(j)) {
      ops.push_back(Op::Insert);
      ++j;
    } else {
      ops.push_back(Op::Equal);
      ++i;
      ++j;
    }
  }
  return ops;
}

std::vector<Hunk> make_hunks(const std::vector<std::string_view> &a,
                             const std::vector<std::string_view> &b, unsigned context,
                             unsigned interhunk) {
  std::vector<Edit> edits;
  {
    std::size_t ia = 0;
    std::size_t ib = 0;
    for (const Op op : myers_diff(a, b)) {
      edits.push_back(Edit{.op = op, .old_index = ia, .new_index = ib});
      if (op != Op::Insert)
        ++ia;
      if (op != Op::Delete)
        ++ib;
    }
  }

  const std::size_t n = edits.size();
  const std::size_t max_gap = (2 * static_cast<std::size_t>(context)) + interhunk;
  std::vector<Hunk> hunks;
  std::size_t prev_end = 0;
  std::size_t i = 0;
  while (i < n) {
    while (i < n && edits[i].op == Op::Equal)
      ++i;
    if (i == n)
      break;

    const std::size_t start = std::max(prev_end, i >= context ? i - context : 0);
    std::size_t j = i;
    std::size_t change_end = i;
    for (;;) {
      while (j < n && edits[j].op != Op::Equal)
        ++j;
      change_end = j;
      std::size_t k = j;
      while (k < n && edits[k].op == Op::Equal)
        ++k;
      if (k == n || k - j > max_gap)
        break;
      j = k;
    }
    const std::size_t end = std::min(n, change_end + context);

    Hunk h;
    h.edits.assign(edits.begin() + static_cast<std::ptrdiff_t>(start),
                   edits.begin() + static_cast<std::ptrdiff_t>(end));
    for (const auto &e : h.edits) {
      if (e.op != Op::Insert)
        ++h.old_lines;
      if (e.op != Op::Delete)
        ++h.new_lines;
    }
    h.old_start = static_cast<std::uint32_t>(edits[start].old_index) + (h.old_lines > 0 ? 1 : 0);
    h.new_start = static_cast<std::uint32_t>(edits[start].new_index) + (h.new_lines > 0 ? 1 : 0);
    hunks.push_back(std::move(h));

    prev_end = end;
    i = end;
  }
  return hunks;
}

std::string hunk_header(const Hunk &hunk) {
  return "@@ -" + format_range(hunk.old_start, hunk.old_lines) + " +" +
         format_range(hunk.new_start, hunk.new_lines) + " @@";
}

std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view path, unsigned context) {
  const auto a = split_lines(old_text);
  const auto b = split_lines(new_text);
  const auto hunks = make_hunks(a, b, context);
  if (hunks.empty())
    return {};

  std::ostringstream out;
  out << "diff --git a/" << path << " b/" << path << "\n";
  out << "--- a/" << path << "\n";
  out << "+++ b/" << path << "\n";

  const auto emit = [&out](char marker, std::string_view line) {
    out << marker << line;
    if (line.empty() || line.back() != '\n')
      out << "\n\\ No newline at end of file\n";
  };

  for (const auto &h : hunks) {
    out << hunk_header(h) << "\n";
    for (const auto &e : h.edits) {
      switch (e.op) {
      case Op::Equal:
        emit(' ', a[e.old_index]);
        break;
      case Op::Delete:
        emit('-', a[e.old_index]);
        break;
      case Op::Insert:
        emit('+', b[e.new_index]);
        break;
      }
    }
  }
  return out.str();
}

} // namespace prism::linediff
