#pragma once

#include <string>
#include <utility>
#include <vector>

/**
 * @brief Warning sink scoped to a single document.
 *
 * Threaded by reference through the shape recolourer and image transformer
 * and merged into that document's ProcessingResult when it finishes. Not
 * shared between documents and not thread-safe.
 */
class DiagnosticsCollector
{
public:
    /**
     * @brief Prefix applied to warnings while alive, e.g. "Slide 3: "
     */
    class Scope
    {
    public:
        Scope(DiagnosticsCollector &collector, std::string prefix)
            : collector_(collector), previous_(std::move(collector.prefix_))
        {
            collector_.prefix_ = previous_ + std::move(prefix);
        }
        ~Scope() { collector_.prefix_ = std::move(previous_); }

        Scope(const Scope &) = delete;
        Scope &operator=(const Scope &) = delete;

    private:
        DiagnosticsCollector &collector_;
        std::string previous_;
    };

    void warn(const std::string &message) { warnings_.push_back(prefix_ + message); }

    const std::vector<std::string> &warnings() const { return warnings_; }
    size_t size() const { return warnings_.size(); }
    bool empty() const { return warnings_.empty(); }

    std::vector<std::string> take()
    {
        std::vector<std::string> out = std::move(warnings_);
        warnings_.clear();
        return out;
    }

private:
    std::vector<std::string> warnings_;
    std::string prefix_;
};
