#include "mathmark/FormulaResolver.hpp"

#include "mathmark/Concurrency.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

namespace mathmark {

const char *toString(ResolutionStatus status) {
  switch (status) {
  case ResolutionStatus::Resolved:
    return "resolved";
  case ResolutionStatus::Failed:
    return "failed";
  case ResolutionStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

int ResolutionReport::count(ResolutionStatus status) const {
  return static_cast<int>(
      std::count_if(entries.begin(), entries.end(),
                    [status](const ResolvedFormula &entry) {
                      return entry.status == status;
                    }));
}

const ResolvedFormula *ResolutionReport::find(int candidateId) const {
  for (const auto &entry : entries) {
    if (entry.candidateId == candidateId)
      return &entry;
  }
  return nullptr;
}

FormulaResolver::FormulaResolver(LatexTranscriber &transcriber,
                                 const MarkerProtocol &protocol,
                                 UnresolvedPolicy policy, int maxConcurrency)
    : m_transcriber(transcriber), m_protocol(protocol), m_policy(policy),
      m_maxConcurrency(maxConcurrency) {}

std::string FormulaResolver::placeholder(int candidateId) {
  std::ostringstream text;
  text << "[formula unavailable: FORMULA_" << std::setw(3) << std::setfill('0')
       << candidateId << "]";
  return text.str();
}

bool FormulaResolver::validateLatex(const std::string &latex,
                                    const MarkerProtocol &protocol,
                                    std::string &reason) {
  if (latex.find_first_not_of(" \t\r\n") == std::string::npos) {
    reason = "empty response";
    return false;
  }
  if (protocol.containsMarker(protocol.canonicalize(latex))) {
    reason = "response contains a marker";
    return false;
  }

  int depth = 0;
  for (size_t i = 0; i < latex.size(); i++) {
    char c = latex[i];
    if (c == '\\') {
      i++; // \{ and \} are literal braces
      continue;
    }
    if (c == '{') {
      depth++;
    } else if (c == '}') {
      if (--depth < 0)
        break;
    }
  }
  if (depth != 0) {
    reason = "unbalanced braces";
    return false;
  }
  return true;
}

std::string FormulaResolver::substitute(const std::string &markdown,
                                        const ResolutionReport &report,
                                        const MarkerProtocol &protocol,
                                        UnresolvedPolicy policy) {
  std::string output;
  output.reserve(markdown.size());
  size_t last = 0;

  for (const auto &occurrence : protocol.findAll(markdown)) {
    output.append(markdown, last, occurrence.position - last);
    last = occurrence.position + occurrence.length;

    const ResolvedFormula *entry = report.find(occurrence.id);
    if (entry == nullptr) {
      output.append(markdown, occurrence.position, occurrence.length);
      continue;
    }
    if (entry->status == ResolutionStatus::Resolved) {
      output += "$$" + entry->latex + "$$";
      continue;
    }

    switch (policy) {
    case UnresolvedPolicy::Placeholder:
      output += placeholder(occurrence.id);
      break;
    case UnresolvedPolicy::Strip:
      break;
    case UnresolvedPolicy::Keep:
    case UnresolvedPolicy::Fail:
      output.append(markdown, occurrence.position, occurrence.length);
      break;
    }
  }
  output.append(markdown, last, std::string::npos);
  return output;
}

std::vector<int> FormulaResolver::findLeaks(const std::string &finalMarkdown,
                                            const ResolutionReport &report,
                                            const MarkerProtocol &protocol,
                                            UnresolvedPolicy policy) {
  std::vector<int> leaks;
  for (const auto &occurrence :
       protocol.findAll(protocol.canonicalize(finalMarkdown))) {
    const ResolvedFormula *entry = report.find(occurrence.id);
    bool permitted = policy == UnresolvedPolicy::Keep && entry != nullptr &&
                     entry->status != ResolutionStatus::Resolved;
    if (!permitted)
      leaks.push_back(occurrence.id);
  }
  return leaks;
}

ResolveResult
FormulaResolver::resolve(const std::string &markdown,
                         const std::vector<FormulaCandidate> &candidates,
                         const std::map<int, FormulaRegionImage> &images,
                         const std::map<int, std::string> &imageErrors) {
  ResolveResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    ResolutionReport &report = result.report;
    std::string canonical =
        m_protocol.canonicalize(markdown, &report.markersRepaired);

    std::set<int> liveIds;
    for (const auto &occurrence : m_protocol.findAll(canonical)) {
      liveIds.insert(occurrence.id);
    }

    std::vector<const FormulaCandidate *> ordered;
    for (const auto &candidate : candidates) {
      ordered.push_back(&candidate);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const FormulaCandidate *a, const FormulaCandidate *b) {
                return a->id < b->id;
              });

    std::set<int> knownIds;
    std::vector<size_t> jobs;
    for (const FormulaCandidate *candidate : ordered) {
      knownIds.insert(candidate->id);

      ResolvedFormula entry;
      entry.candidateId = candidate->id;
      entry.pageIndex = candidate->pageIndex;
      entry.marker = candidate->marker.empty() ? m_protocol.format(candidate->id)
                                               : candidate->marker;

      if (liveIds.count(candidate->id) == 0) {
        entry.status = ResolutionStatus::Skipped;
        entry.reason = "marker lost in structural parsing";
      } else if (images.count(candidate->id) == 0) {
        entry.status = ResolutionStatus::Failed;
        auto error = imageErrors.find(candidate->id);
        entry.reason = error != imageErrors.end() ? error->second
                                                  : "no region image";
      } else {
        jobs.push_back(report.entries.size());
      }
      report.entries.push_back(entry);
    }

    for (int id : liveIds) {
      if (knownIds.count(id) == 0)
        report.unknownMarkerIds.push_back(id);
    }

    // Each job writes only its own entry
    parallelFor(jobs.size(), m_maxConcurrency, [&](size_t job) {
      ResolvedFormula &entry = report.entries[jobs[job]];
      try {
        TranscriptionResult transcription =
            m_transcriber.transcribe(images.at(entry.candidateId));
        entry.attempts = transcription.attempts;
        if (!transcription.success) {
          entry.status = ResolutionStatus::Failed;
          entry.reason = transcription.errorMessage.empty()
                             ? "transcription failed"
                             : transcription.errorMessage;
          return;
        }
        std::string reason;
        if (!validateLatex(transcription.latex, m_protocol, reason)) {
          entry.status = ResolutionStatus::Failed;
          entry.reason = "rejected response: " + reason;
          return;
        }
        entry.status = ResolutionStatus::Resolved;
        entry.latex = transcription.latex;
      } catch (const std::exception &e) {
        entry.status = ResolutionStatus::Failed;
        entry.reason = std::string("transcription failed: ") + e.what();
      }
    });

    result.markdown = substitute(canonical, report, m_protocol, m_policy);

    int unresolved = report.count(ResolutionStatus::Failed) +
                     report.count(ResolutionStatus::Skipped);
    if (m_policy == UnresolvedPolicy::Fail && unresolved > 0) {
      result.errorMessage =
          std::to_string(unresolved) + " formula(s) could not be resolved";
    } else {
      result.success = true;
    }

  } catch (const std::exception &e) {
    result.errorMessage = std::string("Formula resolution failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace mathmark
