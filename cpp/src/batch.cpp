#include "spytext/batch.hpp"

#include <algorithm>
#include <thread>

namespace spytext {

DocumentStatus BatchOutcome::status() const {
    if (error.has_value() || !result.has_value()) {
        return DocumentStatus::kError;
    }
    return document_status(result->assessment);
}

BatchScanner::BatchScanner(const SpyTextSettings& settings, Logger logger)
    : analyzer_(settings), max_workers_(std::max(1, settings.batch.max_workers)), logger_(std::move(logger)) {}

BatchOutcome BatchScanner::scan_one(const std::string& path) const {
    BatchOutcome outcome;
    outcome.path = path;
    try {
        auto document = std::make_shared<SpanDocument>(load_span_document(path));
        outcome.result = analyzer_.analyze(*document);
        outcome.document = std::move(document);
    } catch (const std::exception& exc) {
        outcome.error = exc.what();
        logger_.error("document_scan_failed", {{"path", path}, {"error", exc.what()}});
    }
    return outcome;
}

std::vector<BatchOutcome> BatchScanner::scan(const std::vector<std::string>& paths) {
    std::vector<BatchOutcome> outcomes(paths.size());
    if (paths.empty()) {
        return outcomes;
    }

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        while (true) {
            const std::size_t index = next.fetch_add(1);
            if (index >= paths.size()) {
                return;
            }
            if (!running_) {
                outcomes[index].path = paths[index];
                outcomes[index].error = "scan cancelled";
                continue;
            }
            outcomes[index] = scan_one(paths[index]);
        }
    };

    const auto worker_count = std::min<std::size_t>(static_cast<std::size_t>(max_workers_), paths.size());
    logger_.debug("batch_started", {{"documents", std::to_string(paths.size())},
                                    {"workers", std::to_string(worker_count)}});
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return outcomes;
}

void BatchScanner::stop() {
    running_ = false;
}

DocumentStatus worst_status(const std::vector<BatchOutcome>& outcomes) {
    DocumentStatus worst = DocumentStatus::kSafe;
    for (const auto& outcome : outcomes) {
        const auto status = outcome.status();
        if (exit_code(status) > exit_code(worst)) {
            worst = status;
        }
    }
    return worst;
}

}  // namespace spytext
