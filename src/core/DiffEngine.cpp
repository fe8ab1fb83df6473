#include "core/DiffEngine.hpp"

#include <algorithm>

#include "core/CommitChain.hpp"
#include "core/ObjectStore.hpp"

namespace rit {

namespace {

void appendSegment(std::vector<DiffSegment>& out, SegmentKind kind, const std::string& text) {
    if (!out.empty() && out.back().kind == kind) {
        out.back().text += text;
    } else {
        out.push_back(DiffSegment{kind, text});
    }
}

/**
 * Myers O(ND) line diff in linear space.
 *
 * bisect() runs the greedy search from both ends of a range at once until
 * the two frontiers overlap. The overlap point lies on a shortest edit
 * script, so the range is split there and each half is diffed on its own.
 * Memory stays O(N+M) per level however far apart the texts are.
 */
class LineDiffer {
public:
    LineDiffer(const std::vector<std::string>& a, const std::vector<std::string>& b, std::vector<DiffSegment>& out)
        : a(a), b(b), out(out) {}

    void diff(size_t aLo, size_t aHi, size_t bLo, size_t bHi) {
        while (aLo < aHi && bLo < bHi && a[aLo] == b[bLo]) {
            appendSegment(out, SegmentKind::Equal, a[aLo]);
            ++aLo;
            ++bLo;
        }
        size_t suffix = 0;
        while (aLo + suffix < aHi && bLo + suffix < bHi && a[aHi - 1 - suffix] == b[bHi - 1 - suffix]) {
            ++suffix;
        }
        const size_t aEnd = aHi - suffix;
        const size_t bEnd = bHi - suffix;

        size_t splitA = 0, splitB = 0;
        if (aLo == aEnd) {
            emit(SegmentKind::Added, b, bLo, bEnd);
        } else if (bLo == bEnd) {
            emit(SegmentKind::Removed, a, aLo, aEnd);
        } else if (bisect(aLo, aEnd, bLo, bEnd, splitA, splitB) &&
                   !(splitA == aLo && splitB == bLo) && !(splitA == aEnd && splitB == bEnd)) {
            diff(aLo, splitA, bLo, splitB);
            diff(splitA, aEnd, splitB, bEnd);
        } else {
            emit(SegmentKind::Removed, a, aLo, aEnd);
            emit(SegmentKind::Added, b, bLo, bEnd);
        }

        emit(SegmentKind::Equal, a, aEnd, aHi);
    }

private:
    void emit(SegmentKind kind, const std::vector<std::string>& lines, size_t from, size_t to) {
        for (size_t i = from; i < to; ++i) appendSegment(out, kind, lines[i]);
    }

    // Both ranges are non-empty and differ in their first and last lines.
    // False when the frontiers never meet: every line is removed and added.
    bool bisect(size_t aLo, size_t aHi, size_t bLo, size_t bHi, size_t& splitA, size_t& splitB) const {
        const long n = static_cast<long>(aHi - aLo);
        const long m = static_cast<long>(bHi - bLo);
        const long maxD = (n + m + 1) / 2;
        const long offset = maxD;
        const long width = 2 * maxD + 2;
        const long delta = n - m;
        const bool forwardChecks = (delta % 2 != 0);

        // fwd[offset + k]: furthest x on diagonal k from the start;
        // rev[offset + k]: the same, counted back from the end
        std::vector<long> fwd(static_cast<size_t>(width), -1);
        std::vector<long> rev(static_cast<size_t>(width), -1);
        fwd[offset + 1] = 0;
        rev[offset + 1] = 0;

        long fwdStart = 0, fwdEnd = 0, revStart = 0, revEnd = 0;
        for (long d = 0; d < maxD; ++d) {
            for (long k = -d + fwdStart; k <= d - fwdEnd; k += 2) {
                const long i = offset + k;
                long x = (k == -d || (k != d && fwd[i - 1] < fwd[i + 1])) ? fwd[i + 1] : fwd[i - 1] + 1;
                long y = x - k;
                while (x < n && y < m && a[aLo + x] == b[bLo + y]) {
                    ++x;
                    ++y;
                }
                fwd[i] = x;
                if (x > n) {
                    fwdEnd += 2;
                } else if (y > m) {
                    fwdStart += 2;
                } else if (forwardChecks) {
                    const long j = offset + delta - k;
                    if (j >= 0 && j < width && rev[j] != -1 && rev[j] <= n && x >= n - rev[j]) {
                        splitA = aLo + static_cast<size_t>(x);
                        splitB = bLo + static_cast<size_t>(y);
                        return true;
                    }
                }
            }

            for (long k = -d + revStart; k <= d - revEnd; k += 2) {
                const long i = offset + k;
                long x = (k == -d || (k != d && rev[i - 1] < rev[i + 1])) ? rev[i + 1] : rev[i - 1] + 1;
                long y = x - k;
                while (x < n && y < m && a[aHi - 1 - x] == b[bHi - 1 - y]) {
                    ++x;
                    ++y;
                }
                rev[i] = x;
                if (x > n) {
                    revEnd += 2;
                } else if (y > m) {
                    revStart += 2;
                } else if (!forwardChecks) {
                    const long j = offset + delta - k;
                    if (j >= 0 && j < width && fwd[j] != -1) {
                        const long fx = fwd[j];
                        const long fy = fx - (j - offset);
                        if (fx <= n && fy >= 0 && fy <= m && fx >= n - x) {
                            splitA = aLo + static_cast<size_t>(fx);
                            splitB = bLo + static_cast<size_t>(fy);
                            return true;
                        }
                    }
                }
            }
        }
        return false;
    }

    const std::vector<std::string>& a;
    const std::vector<std::string>& b;
    std::vector<DiffSegment>& out;
};

// Last entry for path wins when the list repeats it
const IndexEntry* findLastByPath(const std::vector<IndexEntry>& files, const std::string& path) {
    auto it = std::find_if(files.rbegin(), files.rend(),
                           [&](const IndexEntry& e) { return e.path == path; });
    return it == files.rend() ? nullptr : &*it;
}

}

DiffEngine::DiffEngine(const ObjectStore& store, const CommitChain& chain)
    : store(store), chain(chain) {}

std::vector<std::string> DiffEngine::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::vector<DiffSegment> DiffEngine::diffLines(const std::string& oldText, const std::string& newText) {
    const std::vector<std::string> a = splitLines(oldText);
    const std::vector<std::string> b = splitLines(newText);

    std::vector<DiffSegment> out;
    LineDiffer(a, b, out).diff(0, a.size(), 0, b.size());
    return out;
}

std::string DiffEngine::reconstructOld(const std::vector<DiffSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        if (s.kind != SegmentKind::Added) out += s.text;
    }
    return out;
}

std::string DiffEngine::reconstructNew(const std::vector<DiffSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        if (s.kind != SegmentKind::Removed) out += s.text;
    }
    return out;
}

Expected<std::vector<FileDiff>> DiffEngine::showCommitDiff(const std::string& hash) const {
    auto target = chain.getCommit(hash);
    if (!target) return target.error();
    const Commit& commit = target.value();

    Commit parent;
    if (!commit.isRoot()) {
        auto loaded = chain.getCommit(commit.parent);
        if (!loaded) return loaded.error();
        parent = std::move(loaded.value());
    }

    std::vector<FileDiff> result;
    result.reserve(commit.files.size());

    for (const auto& entry : commit.files) {
        auto newText = store.get(entry.hashHex);
        if (!newText) return newText.error();

        FileDiff fd;
        fd.path = entry.path;
        fd.hash = entry.hashHex;

        if (commit.isRoot()) {
            fd.status = FileStatus::InitialCommit;
        } else if (const IndexEntry* match = findLastByPath(parent.files, entry.path)) {
            auto oldText = store.get(match->hashHex);
            if (!oldText) return oldText.error();
            fd.status = FileStatus::Modified;
            fd.parentHash = match->hashHex;
            fd.segments = diffLines(oldText.value(), newText.value());
        } else {
            fd.status = FileStatus::NewFile;
        }
        result.push_back(std::move(fd));
    }
    return result;
}

}
