#include "courier.h"
#include "cost_estimator.h"

RateTable RateTable::defaults() {
    RateTable table;

    // OpenAI
    table.set_rate("gpt-4", 0.03, 0.06);
    table.set_rate("gpt-4-turbo", 0.01, 0.03);
    table.set_rate("gpt-4o", 0.005, 0.015);
    table.set_rate("gpt-4o-mini", 0.00015, 0.0006);
    table.set_rate("gpt-3.5-turbo", 0.0015, 0.002);

    // Bedrock / Anthropic (approximate, prices vary by region)
    table.set_rate("anthropic.claude-3-5-sonnet-20241022-v2:0", 0.003, 0.015);
    table.set_rate("anthropic.claude-3-5-sonnet-20240620-v1:0", 0.003, 0.015);
    table.set_rate("anthropic.claude-3-5-haiku-20241022-v1:0", 0.0008, 0.004);
    table.set_rate("anthropic.claude-3-sonnet-20240229-v1:0", 0.003, 0.015);
    table.set_rate("anthropic.claude-3-haiku-20240307-v1:0", 0.00025, 0.00125);
    table.set_rate("anthropic.claude-3-opus-20240229-v1:0", 0.015, 0.075);

    table.set_alias("claude-3-sonnet", "anthropic.claude-3-sonnet-20240229-v1:0");
    table.set_alias("claude-3-haiku", "anthropic.claude-3-haiku-20240307-v1:0");
    table.set_alias("claude-3-opus", "anthropic.claude-3-opus-20240229-v1:0");
    table.set_alias("claude-3.5-sonnet", "anthropic.claude-3-5-sonnet-20240620-v1:0");
    table.set_alias("claude-3.5-sonnet-v2", "anthropic.claude-3-5-sonnet-20241022-v2:0");
    table.set_alias("claude-3.5-haiku", "anthropic.claude-3-5-haiku-20241022-v1:0");

    return table;
}

void RateTable::set_rate(const std::string& model, double prompt_per_1k, double completion_per_1k) {
    rates_[model] = Rate{prompt_per_1k, completion_per_1k};
}

void RateTable::set_alias(const std::string& alias, const std::string& model) {
    aliases_[alias] = model;
}

std::string RateTable::resolve(const std::string& model) const {
    auto it = aliases_.find(model);
    return it == aliases_.end() ? model : it->second;
}

const RateTable::Rate* RateTable::find(const std::string& model) const {
    auto it = rates_.find(resolve(model));
    return it == rates_.end() ? nullptr : &it->second;
}

double CostEstimator::estimate(const std::string& model, int prompt_tokens, int completion_tokens) const {
    const RateTable::Rate* rate = table_.find(model);
    if (!rate) {
        LOG_DEBUG("No rate for model '" + model + "', cost defaults to 0");
        return 0.0;
    }

    double prompt_cost = (prompt_tokens / 1000.0) * rate->prompt_per_1k;
    double completion_cost = (completion_tokens / 1000.0) * rate->completion_per_1k;
    return courier::round_to(prompt_cost + completion_cost, 6);
}

CostRecord CostEstimator::estimate_record(const std::string& model, int prompt_tokens, int completion_tokens) const {
    CostRecord record;
    record.model = model;
    record.prompt_tokens = prompt_tokens;
    record.completion_tokens = completion_tokens;
    record.cost = estimate(model, prompt_tokens, completion_tokens);
    return record;
}
