#include "intent_dispatcher.h"

#include "HealthAQ.Core/string_util.h"

#include <memory>
#include <regex>
#include <set>
#include <stdexcept>

namespace {

using haq::DispatchPredicate;
using haq::DispatchRule;
using haq::Intent;
using haq::ParsedQuery;

using PatternList = std::vector<std::regex>;

std::shared_ptr<const PatternList> compile(std::initializer_list<const char *> patterns) {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    auto result = std::make_shared<PatternList>();
    for (const auto *pattern : patterns) {
        result->emplace_back(pattern, flags);
    }

    return result;
}

bool any_match(const PatternList &patterns, std::string_view text) {
    const auto value = std::string{text};
    for (const auto &pattern : patterns) {
        if (std::regex_search(value, pattern)) {
            return true;
        }
    }

    return false;
}

DispatchPredicate keywords(std::shared_ptr<const PatternList> patterns) {
    return [patterns = std::move(patterns)](std::string_view text, const ParsedQuery &) {
        return any_match(*patterns, text);
    };
}

DispatchRule keyword_rule(std::string name, Intent intent,
                          std::initializer_list<const char *> patterns) {
    return DispatchRule{std::move(name), intent, keywords(compile(patterns))};
}

} // anonymous namespace

namespace haq {

IntentDispatcher::IntentDispatcher() : IntentDispatcher(default_rules()) {}

IntentDispatcher::IntentDispatcher(std::vector<DispatchRule> rules) : rules_{std::move(rules)} {
    if (rules_.empty()) {
        throw std::invalid_argument("The intent dispatch table must not be empty.");
    }

    auto names = std::set<std::string>{};
    for (const auto &rule : rules_) {
        if (!rule.predicate) {
            throw std::invalid_argument("Dispatch rule without predicate: " + rule.name);
        }

        if (!names.emplace(rule.name).second) {
            throw std::invalid_argument("Duplicated dispatch rule name: " + rule.name);
        }
    }
}

Intent IntentDispatcher::dispatch(const ParsedQuery &query, std::string_view raw_text) const {
    const auto *rule = match(query, raw_text);
    if (rule == nullptr) {
        return Intent::unrecognized;
    }

    return rule->intent;
}

const DispatchRule *IntentDispatcher::match(const ParsedQuery &query,
                                            std::string_view raw_text) const {
    const auto lowered =
        core::collapse_whitespace(core::to_lower(raw_text.substr(0, MaxMessageLength)));
    for (const auto &rule : rules_) {
        if (rule.predicate(lowered, query)) {
            return &rule;
        }
    }

    return nullptr;
}

std::vector<DispatchRule> IntentDispatcher::default_rules() {
    auto rules = std::vector<DispatchRule>{};

    // Priority A, overrides everything else
    rules.emplace_back(keyword_rule(
        "scenario", Intent::scenario_pm25_change,
        {R"(\d+\s*%)",
         R"(\d+\s+percent)",
         R"(\b(rise|increase|grow)[sd]?\s+by\s+\d(?!\d{3}))",
         R"(\b(reduce|decrease|drop|cut|lower)\w*\s+by\s+\d(?!\d{3}))",
         R"(\breduce\b)",
         R"(\breduction\b)",
         R"(\bcuts?\s+(pm|pollution)\b)",
         R"(\bdrop\s+(pm|pollution)\b)",
         R"(\blower\s*by\b)",
         R"(\braise\s*by\b)",
         R"(\bif\b.*\bredu)",
         R"(\bwhat\s+if\b)",
         R"(\bwhat\s+happens?\b)",
         R"(\bhow\s+many\s+(deaths?|lives?)\s+(saved|prevented|happen))",
         R"(\bbaseline\s+vs\b)",
         R"(\bsensitive\s+to\s+a\s+\d)",
         R"(\bmarginal\s+death)",
         R"(\bwho\s+guideline\b)",
         R"(\bstays?\s+at\b)",
         R"(\bdrops?\s+below\b)"}));

    rules.emplace_back(keyword_rule("sensitivity", Intent::sensitivity_pm25_deaths,
                                    {R"(\bsensitiv\w*\s+(to|of)\s+pm)",
                                     R"(\bsensitiv\w*\s+(to|of)\s+pollution)",
                                     R"(\bmost\s+sensitive\b)",
                                     R"(\belasticity\b)",
                                     R"(\bper\s+1\s*(ug|microgram))",
                                     R"(\bmarginal\s+effect\b)",
                                     R"(\bdeaths?\s+per\s+(ug|unit)\b)"}));

    rules.emplace_back(keyword_rule("lowest_burden", Intent::lowest_health_burden,
                                    {R"(\blowest\s+(health\s+)?burden\b)",
                                     R"(\bleast\s+(health\s+)?burden\b)",
                                     R"(\blowest\s+deaths?\b)",
                                     R"(\bleast\s+deaths?\b)",
                                     R"(\bfewest\s+deaths?\b)",
                                     R"(\blowest\s+mortality\b)",
                                     R"(\blowest\s+dalys?\b)",
                                     R"(\bleast\s+dalys?\b)"}));

    rules.emplace_back(keyword_rule("fastest_improvement", Intent::fastest_improvement_pm25,
                                    {R"(\bimproving\s+fastest\b)",
                                     R"(\bfastest\s+improv)",
                                     R"(\bmost\s+improved\b)",
                                     R"(\bimproved?\s+most\b)",
                                     R"(\bcleaner\s+fastest\b)",
                                     R"(\bgetting\s+cleaner\s+fast)",
                                     R"(\b(worse|worsening)\s+fastest\b)",
                                     R"(\bgetting\s+worse\s+fast)"}));

    rules.emplace_back(keyword_rule("stability", Intent::stability_pm25,
                                    {R"(\bmost\s+stable\b)",
                                     R"(\bleast\s+stable\b)",
                                     R"(\bstable\s+(pollution\s+)?pattern\b)",
                                     R"(\bmost\s+volatile\b)",
                                     R"(\bleast\s+volatile\b)",
                                     R"(\bvolatil)",
                                     R"(\bstable\s+or\s+volatile\b)"}));

    rules.emplace_back(keyword_rule("rank_pm25", Intent::rank_pm25,
                                    {R"(\btop\s+\d+\s+(most\s+)?polluted\b)",
                                     R"(\bhighest\s+pm\s*2\.?5\b)",
                                     R"(\blowest\s+pm\s*2\.?5\b)",
                                     R"(\brank\w*\s+by\s+pm\s*2?\.?5?\b)",
                                     R"(\brank\w*\s+by\s+pollution\b)",
                                     R"(\bmost\s+polluted\b)",
                                     R"(\bleast\s+polluted\b)",
                                     R"(\bcleanest\b(?!\s+(month|air)\b))"}));

    rules.emplace_back(keyword_rule(
        "deaths_change_yoy", Intent::deaths_change_yoy,
        {R"(\bdeaths?\s+(increase|decrease|change|grew|dropped)\w*\s+(compared|vs|versus|from)\b)",
         R"(\b(increase|decrease|change)\w*\s+in\s+deaths?\b)",
         R"(\byoy\s+deaths?\b)",
         R"(\bdeaths?\s+yoy\b)",
         R"(\bdeaths?\s+this\s+year\s+vs\b)",
         R"(\bpollution\s+deaths?\s+(increase|decrease)\w*\s+(compared|vs)\b)",
         R"(\bdeaths?\s+(increase|decrease)\w*.*\b(compared|last\s+year)\b)"}));

    // Priority B, standard intents
    rules.emplace_back(keyword_rule("risk_ranking", Intent::risk_ranking,
                                    {R"(\branke?d?\s+by\s+risk\b)",
                                     R"(\branking\b)",
                                     R"(\brisk\s+ranking\b)",
                                     R"(\bregional\s+risk\b)",
                                     R"(\bacross\s+all\b)",
                                     R"(\bshow\s+countries\b)",
                                     R"(\branke?d?\b)",
                                     R"(\brank\w*\s+by\s+(death|mortality)\b)"}));

    rules.emplace_back(keyword_rule("highest_risk", Intent::highest_risk_country,
                                    {R"(\bhighest\s+risk(\s+score)?\b)",
                                     R"(\bhighest\s+pollution\s+risk\b)",
                                     R"(\blowest\s+risk(\s+score)?\b)",
                                     R"(\bmost\s+dangerous\b)",
                                     R"(\bgetting\s+(cleaner|worse)\b.*\bregion\b)",
                                     R"(\boverall\b.*\bregion\b)"}));

    rules.emplace_back(keyword_rule("dalys", Intent::health_dalys,
                                    {R"(\bdalys?\b)", R"(\bdisability[- ]adjusted\b)"}));

    rules.emplace_back(keyword_rule("explainability", Intent::explainability,
                                    {R"(\bwhy\s+is\b)",
                                     R"(\bwhat\s+(are\s+the\s+)?main\s+drivers?\b)",
                                     R"(\bfactors?\s+contribut)",
                                     R"(\bwhat\s+features?\b)",
                                     R"(\bwhat\s+assumptions?\b)",
                                     R"(\bhow\s+reliable\b)",
                                     R"(\bhow\s+certain\b)",
                                     R"(\bwhy\s+does\b)",
                                     R"(\bwhy\s+(is\s+)?confidence\b)",
                                     R"(\bnonlinear\b)",
                                     R"(\bdiminishing\s+returns\b)",
                                     R"(\bstructural\s+break\b)"}));

    rules.emplace_back(keyword_rule("risk_level", Intent::risk_level,
                                    {R"(\brisk\s+level\b)",
                                     R"(\brisk\s+tier\b)",
                                     R"(\bhigh\s+risk\b)",
                                     R"(\bmoderate\s+risk\b)",
                                     R"(\bred\s+zone\b)",
                                     R"(\brisk\s+score\b)"}));

    rules.emplace_back(keyword_rule("trend", Intent::trend_pm25,
                                    {R"(\btrend\b)",
                                     R"(\btrajectory\b)",
                                     R"(\bimproving\b)",
                                     R"(\bimproved\b)",
                                     R"(\bworsening\b)",
                                     R"(\bincreasing\b)",
                                     R"(\bdecreasing\b)",
                                     R"(\bgetting\s+(better|worse|cleaner)\b)",
                                     R"(\bover\s+the\s+years?\b)",
                                     R"(\bover\s+time\b)",
                                     R"(\bover\s+the\s+next\b)",
                                     R"(\byear\s+over\s+year\b)",
                                     R"(\bprojection\b)",
                                     R"(\bprojected\b)",
                                     R"(\bgrowth\s+rate\b)",
                                     R"(\b\d+[- ]year\b)",
                                     R"(\bphase\b)",
                                     R"(\bregime\b)",
                                     R"(\bpercentage\s+(increase|decrease)\b)",
                                     R"(\b20\d{2}-20\d{2}\b)"}));

    // Two years with fewer than two countries is a change over time, not a comparison
    auto compare_patterns = compile({R"(\bcompare\b)", R"(\bvs\b)", R"(\bversus\b)"});
    rules.emplace_back(
        DispatchRule{"compare", Intent::compare_health,
                     [patterns = std::move(compare_patterns)](std::string_view text,
                                                              const ParsedQuery &query) {
                         auto over_time =
                             query.year_range.has_value() && query.countries.size() < 2;
                         return !over_time && any_match(*patterns, text);
                     }});

    auto change_patterns = compile({R"(\bfrom\s+20\d{2}\s+to\s+20\d{2}\b)",
                                    R"(\bbetween\s+20\d{2}\s+and\s+20\d{2}\b)",
                                    R"(\bsince\s+20\d{2}\b)",
                                    R"(\bchange\b)",
                                    R"(\bdifference\b)",
                                    R"(\b20\d{2}\s+(vs|versus)\s+20\d{2}\b)",
                                    R"(\boutlook\b)"});
    rules.emplace_back(DispatchRule{"pm25_change", Intent::pm25_change,
                                    [patterns = change_patterns](std::string_view text,
                                                                 const ParsedQuery &query) {
                                        return query.year_range.has_value() &&
                                               any_match(*patterns, text);
                                    }});

    // Change keywords without a year range degrade to a single year forecast
    rules.emplace_back(DispatchRule{"pm25_change_single_year_monthly",
                                    Intent::pm25_forecast_monthly,
                                    [patterns = change_patterns](std::string_view text,
                                                                 const ParsedQuery &query) {
                                        return query.month.has_value() &&
                                               any_match(*patterns, text);
                                    }});
    rules.emplace_back(DispatchRule{
        "pm25_change_single_year", Intent::pm25_forecast,
        [patterns = change_patterns](std::string_view text, const ParsedQuery &) {
            return any_match(*patterns, text);
        }});

    rules.emplace_back(keyword_rule("health_rate", Intent::health_rate,
                                    {R"(\bper\s+100[,.]?000\b)",
                                     R"(\bdeath\s+rate\b)",
                                     R"(\bmortality\s+rate\b)",
                                     R"(\bper\s+capita\b)",
                                     R"(\bper\s+lakh\b)"}));

    rules.emplace_back(keyword_rule("health_deaths", Intent::health_deaths,
                                    {R"(\bdeaths?\b)",
                                     R"(\bmortality\b)",
                                     R"(\battribut)",
                                     R"(\bdie\b)",
                                     R"(\bkill)",
                                     R"(\bhow\s+many\s+(people\s+)?die)",
                                     R"(\bhealth\s+(risk|impact|burden|effect)\b)",
                                     R"(\bconfidence\s+interval\b)"}));

    rules.emplace_back(keyword_rule("top_diseases", Intent::top_diseases,
                                    {R"(\btop\s+\d*\s*diseases?\b)",
                                     R"(^(?!.*\bmonthly\s+breakdown\b).*\bbreakdown\b)",
                                     R"(\bcaused\s+by\b)",
                                     R"(\bwhich\s+diseases?\b)",
                                     R"(\bdisease\s+list\b)",
                                     R"(\bdisease\s+burden\b)",
                                     R"(\bcontribute\s+most\b)",
                                     R"(\blinked\s+to\s+pollution\b)",
                                     R"(\bsensitive\b.*\bdisease\b)",
                                     R"(\bdisease\b.*\bsensitive\b)"}));

    rules.emplace_back(keyword_rule("best_month", Intent::best_month,
                                    {R"(\bbest\s+(month|time|period)\b)",
                                     R"(\bcleanest\s+(month|air)\b)",
                                     R"(\bwhen\s+to\s+(visit|travel)\b)",
                                     R"(\bsafest\s+month\b)",
                                     R"(\bmonthly\s+(breakdown|data|prediction)\b)"}));

    rules.emplace_back(keyword_rule("worst_month", Intent::worst_month,
                                    {R"(\bworst\s+(month|time|period)\b)",
                                     R"(\bmost\s+polluted\s+month\b)",
                                     R"(\bavoid\s+visiting\b)",
                                     R"(\bpeak\s+pollution\b)"}));

    rules.emplace_back(keyword_rule(
        "list_countries", Intent::list_countries,
        {R"(\b(which|what|list)\s+(of\s+)?(the\s+)?(all\s+)?countries\b)",
         R"(\blist\s+(all\s+)?(the\s+)?countries\b)",
         R"(\bavailable\s+countries\b)",
         R"(\bcountries\s+(are\s+)?(available|supported|covered)\b)"}));

    auto forecast_patterns = compile({R"(\bpm\s*2\.?5\b)",
                                      R"(\bair\s+quality\b)",
                                      R"(\bforecast)",
                                      R"(\bpredict)",
                                      R"(\baqi\b)",
                                      R"(\bhow\s+polluted\b)",
                                      R"(\bconcentration\b)",
                                      R"(\bpollution\s+levels?\b)"});
    rules.emplace_back(DispatchRule{"forecast_monthly", Intent::pm25_forecast_monthly,
                                    [patterns = forecast_patterns](std::string_view text,
                                                                   const ParsedQuery &query) {
                                        return query.month.has_value() &&
                                               any_match(*patterns, text);
                                    }});
    rules.emplace_back(DispatchRule{
        "forecast", Intent::pm25_forecast,
        [patterns = forecast_patterns](std::string_view text, const ParsedQuery &) {
            return any_match(*patterns, text);
        }});

    // Catch-all, a country and a year both present
    rules.emplace_back(DispatchRule{"fallback_monthly", Intent::pm25_forecast_monthly,
                                    [](std::string_view, const ParsedQuery &query) {
                                        return query.country.has_value() &&
                                               query.year.has_value() &&
                                               query.month.has_value();
                                    }});
    rules.emplace_back(DispatchRule{"fallback", Intent::pm25_forecast,
                                    [](std::string_view, const ParsedQuery &query) {
                                        return query.country.has_value() &&
                                               query.year.has_value();
                                    }});

    return rules;
}

} // namespace haq
