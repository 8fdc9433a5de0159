#include "sanityml/scan_pool.hpp"
#include "sanityml/io/mapped_file.hpp"
#include "sanityml/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <thread>

namespace sanityml {

std::string extension_of(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

ScanPool::ScanPool(std::shared_ptr<const rules::RuleTable> rules,
                   ScanOptions options,
                   std::shared_ptr<const deps::AdvisorySource> advisories)
    : advisories_(std::move(advisories))
    , scanner_(std::move(rules), std::move(options), advisories_.get()) {}

size_t ScanPool::worker_count(size_t jobs) const {
    size_t workers = static_cast<size_t>(options().num_workers);
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) workers = 1;
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

ArtifactReport ScanPool::scan_file(const ScanTarget& target) const {
    const std::string path = target.path.string();

    Deadline deadline;
    if (options().artifact_timeout_ms > 0) {
        deadline = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(options().artifact_timeout_ms);
    }

    auto unopened = [&](ScanErrorKind kind, const std::string& message) {
        ArtifactReport report;
        report.path = path;
        report.kind = target.kind;
        report.aborted_in = ScanState::Unopened;
        report.findings.push_back(make_error_finding(path, "", kind, message, 0));
        report.state = ScanState::Reported;
        return report;
    };

    io::FileBuffer buffer;
    try {
        buffer = io::FileBuffer::load(target.path, options().max_artifact_bytes);
    } catch (const StreamError& e) {
        return unopened(e.kind(), e.what());
    }

    Artifact artifact;
    artifact.path = path;
    artifact.kind = target.kind;
    artifact.extension = extension_of(target.path);
    artifact.bytes = buffer.view();

    try {
        return scanner_.scan(artifact, deadline);
    } catch (const std::exception& e) {
        log_message(parse_log_level(options().log_level), LogLevel::Error,
                    sanitize_path_for_error(path) + ": " + e.what());
        return unopened(ScanErrorKind::ReadError, e.what());
    }
}

std::vector<ArtifactReport> ScanPool::run(const std::vector<ScanTarget>& targets) const {
    std::vector<ArtifactReport> results(targets.size());
    if (targets.empty()) {
        return results;
    }

    std::atomic<size_t> next{0};
    auto worker_loop = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= targets.size()) {
                return;
            }
            results[i] = scan_file(targets[i]);
        }
    };

    const size_t num_workers = worker_count(targets.size());
    log_message(parse_log_level(options().log_level), LogLevel::Debug,
                "Scanning " + std::to_string(targets.size()) + " artifacts with " +
                std::to_string(num_workers) + " workers");

    if (num_workers == 1) {
        worker_loop();
        return results;
    }

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers.emplace_back(worker_loop);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    return results;
}

std::vector<Finding> merge_findings(const std::vector<ArtifactReport>& reports) {
    std::vector<Finding> all;
    for (const auto& report : reports) {
        all.insert(all.end(), report.findings.begin(), report.findings.end());
    }
    sort_findings(all);
    return all;
}

} // namespace sanityml
