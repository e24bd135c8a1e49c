#pragma once

#include "completion.h"
#include <string>
#include <map>

/// @brief Per-model pricing plus short-name aliases
/// Rates are USD per 1K tokens. Aliases are resolved before lookup.
class RateTable {
public:
    struct Rate {
        double prompt_per_1k = 0.0;
        double completion_per_1k = 0.0;
    };

    /// @brief Built-in OpenAI and Bedrock/Anthropic rates
    static RateTable defaults();

    void set_rate(const std::string& model, double prompt_per_1k, double completion_per_1k);
    void set_alias(const std::string& alias, const std::string& model);

    /// @brief Alias -> canonical id; unknown names are returned unchanged
    std::string resolve(const std::string& model) const;

    /// @brief Rate for a model (after alias resolution), nullptr if unknown
    const Rate* find(const std::string& model) const;

    const std::map<std::string, Rate>& rates() const { return rates_; }
    const std::map<std::string, std::string>& aliases() const { return aliases_; }

private:
    std::map<std::string, Rate> rates_;
    std::map<std::string, std::string> aliases_;
};

/// @brief Pure cost calculation over a RateTable
/// Immutable after construction; safe to call from any thread without locking
class CostEstimator {
public:
    CostEstimator() : table_(RateTable::defaults()) {}
    explicit CostEstimator(RateTable table) : table_(std::move(table)) {}

    /// @brief round6(prompt/1000 * prompt_rate + completion/1000 * completion_rate)
    /// Unknown models cost 0.0
    double estimate(const std::string& model, int prompt_tokens, int completion_tokens) const;

    CostRecord estimate_record(const std::string& model, int prompt_tokens, int completion_tokens) const;

    const RateTable& table() const { return table_; }

private:
    RateTable table_;
};
