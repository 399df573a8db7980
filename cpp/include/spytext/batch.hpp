#ifndef SPYTEXT_BATCH_HPP
#define SPYTEXT_BATCH_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "spytext/api.hpp"
#include "spytext/config.hpp"
#include "spytext/logging.hpp"
#include "spytext/report.hpp"

namespace spytext {

struct BatchOutcome {
    std::string path;
    std::shared_ptr<const SpanDocument> document;
    std::optional<AnalysisResult> result;
    std::optional<std::string> error;

    DocumentStatus status() const;
};

class BatchScanner {
public:
    explicit BatchScanner(const SpyTextSettings& settings, Logger logger = get_logger("BatchScanner"));

    std::vector<BatchOutcome> scan(const std::vector<std::string>& paths);

    void stop();

    int max_workers() const { return max_workers_; }

private:
    BatchOutcome scan_one(const std::string& path) const;

    DocumentAnalyzer analyzer_;
    int max_workers_ = 1;
    Logger logger_;
    std::atomic<bool> running_{true};
};

DocumentStatus worst_status(const std::vector<BatchOutcome>& outcomes);

}  // namespace spytext

#endif  // SPYTEXT_BATCH_HPP
