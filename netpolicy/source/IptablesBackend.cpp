/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   IptablesBackend.cpp
 *
 */
#include "IptablesBackend.h"

#include <Logging.h>

#include <algorithm>
#include <iterator>
#include <sstream>


IptablesBackend::IptablesBackend(const std::shared_ptr<IProcessRunner>& runner,
                                 const std::string& iptablesPath,
                                 const std::string& iptablesSavePath)
    : mRunner(runner)
    , mIptablesPath(iptablesPath)
    , mIptablesSavePath(iptablesSavePath)
{
}

NatBackend IptablesBackend::type() const
{
    return NatBackend::Iptables;
}

std::string IptablesBackend::render(const PolicyState& state) const
{
    return RuleRenderer::renderIptablesText(RuleRenderer::renderIptables(state));
}

// -----------------------------------------------------------------------------
/**
 *  @brief Brings the installed rules in line with @a desired.
 *
 *  Rules rendered for @a previous that aren't in the desired set are deleted
 *  first (if present), then every desired rule is appended if it's not
 *  already installed.
 *
 *  Stops at the first failure, the caller is expected to re-apply the
 *  persisted state to recover, which is safe as every step is idempotent.
 */
PolicyResult IptablesBackend::apply(const PolicyState& desired,
                                    const PolicyState* previous)
{
    QUAY_LOG_FN_ENTRY();

    const std::list<IptablesRule> desiredRules = RuleRenderer::renderIptables(desired);

    if (!desired.acls.empty())
    {
        QUAY_LOG_WARN("%zu IPv6 ACLs are not enforced by the iptables backend",
                      desired.acls.size());
    }

    if (previous != nullptr)
    {
        const std::list<IptablesRule> previousRules = RuleRenderer::renderIptables(*previous);
        for (const IptablesRule& rule : previousRules)
        {
            if (std::find(desiredRules.begin(), desiredRules.end(), rule) != desiredRules.end())
                continue;

            PolicyResult result = deleteIfPresent(rule);
            if (!result.ok())
            {
                QUAY_LOG_FN_EXIT();
                return result;
            }
        }
    }

    for (const IptablesRule& rule : desiredRules)
    {
        PolicyResult result = appendIfAbsent(rule);
        if (!result.ok())
        {
            QUAY_LOG_FN_EXIT();
            return result;
        }
    }

    QUAY_LOG_INFO("iptables rules applied (%zu rules)", desiredRules.size());

    QUAY_LOG_FN_EXIT();
    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Deletes every installed rule carrying our owner comment.
 *
 *  The current rules are read with iptables-save, so rules left behind by a
 *  crash or an older state are removed too.
 */
PolicyResult IptablesBackend::flush()
{
    QUAY_LOG_FN_ENTRY();

    const ProcessResult saved = mRunner->run(mIptablesSavePath, { });
    if (!saved.succeeded())
    {
        QUAY_LOG_ERROR_EXIT("failed to read current rules - %s",
                            saved.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "iptables-save: " + saved.diagnostic());
    }

    const std::list<IptablesRule> owned = parseOwnedRules(saved.stdOut);
    for (const IptablesRule& rule : owned)
    {
        const ProcessResult result = runIptables("-D", rule);
        if (!result.succeeded())
        {
            QUAY_LOG_ERROR_EXIT("failed to delete rule '%s' - %s",
                                rule.toString().c_str(), result.diagnostic().c_str());
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "iptables: " + result.diagnostic());
        }
    }

    QUAY_LOG_INFO("flushed %zu iptables rules", owned.size());

    QUAY_LOG_FN_EXIT();
    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Picks the rules with our owner comment out of iptables-save output.
 *
 *  The first character on a line indicates what follows, a '*' represents a
 *  table name, a ':' is the chain name and default policy with packet
 *  counts, and a '-' represents a rule.  We only care about tables and rules.
 */
std::list<IptablesRule> IptablesBackend::parseOwnedRules(const std::string& saveOutput)
{
    std::list<IptablesRule> rules;

    std::istringstream stream(saveOutput);
    std::string line;
    std::string table;

    while (std::getline(stream, line))
    {
        if (line.empty())
            continue;

        if (line[0] == '*')
        {
            table = line.substr(1);
            continue;
        }

        if ((line.compare(0, 3, "-A ") != 0) || table.empty())
            continue;

        std::list<std::string> tokens = splitRuleLine(line);
        if (tokens.size() < 3)
            continue;

        // look for '--comment quay'
        bool owned = false;
        for (auto it = tokens.begin(); it != tokens.end(); ++it)
        {
            auto next = std::next(it);
            if ((*it == "--comment") && (next != tokens.end()) &&
                (*next == QUAY_RULE_OWNER_TAG))
            {
                owned = true;
                break;
            }
        }

        if (!owned)
            continue;

        IptablesRule rule;
        rule.table = table;
        tokens.pop_front();
        rule.chain = tokens.front();
        tokens.pop_front();
        rule.args = std::move(tokens);

        rules.push_back(std::move(rule));
    }

    return rules;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Splits an iptables-save rule line into args, double quoted strings
 *  (as used for comments with spaces) are kept as a single arg.
 */
std::list<std::string> IptablesBackend::splitRuleLine(const std::string& line)
{
    std::list<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool haveToken = false;

    for (size_t i = 0; i < line.size(); i++)
    {
        const char c = line[i];
        if (inQuotes)
        {
            if ((c == '\\') && ((i + 1) < line.size()))
                current += line[++i];
            else if (c == '"')
                inQuotes = false;
            else
                current += c;
        }
        else if (c == '"')
        {
            inQuotes = true;
            haveToken = true;
        }
        else if ((c == ' ') || (c == '\t'))
        {
            if (haveToken)
                tokens.push_back(current);
            current.clear();
            haveToken = false;
        }
        else
        {
            current += c;
            haveToken = true;
        }
    }

    if (haveToken)
        tokens.push_back(current);

    return tokens;
}

ProcessResult IptablesBackend::runIptables(const char* operation,
                                           const IptablesRule& rule)
{
    std::list<std::string> args = { "-w", "-t", rule.table, operation, rule.chain };
    args.insert(args.end(), rule.args.begin(), rule.args.end());

    return mRunner->run(mIptablesPath, args);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Checks if the exact rule is installed.
 *
 *      iptables -w -t <table> -C <chain> <args>
 *
 *  Exit code 0 means the rule exists, 1 means it doesn't, anything else is an
 *  error.
 */
IptablesBackend::RuleState IptablesBackend::checkRule(const IptablesRule& rule,
                                                      std::string* diagnostic)
{
    const ProcessResult result = runIptables("-C", rule);
    if (result.succeeded())
        return RuleState::Present;

    if (result.started && !result.timedOut && (result.exitCode == 1))
        return RuleState::Absent;

    *diagnostic = result.diagnostic();
    return RuleState::Error;
}

PolicyResult IptablesBackend::appendIfAbsent(const IptablesRule& rule)
{
    std::string diagnostic;
    switch (checkRule(rule, &diagnostic))
    {
        case RuleState::Present:
            QUAY_LOG_DEBUG("rule '%s' already installed", rule.toString().c_str());
            return PolicyResult::success();

        case RuleState::Absent:
            break;

        case RuleState::Error:
            QUAY_LOG_ERROR("failed to check rule '%s' - %s",
                           rule.toString().c_str(), diagnostic.c_str());
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "iptables: " + diagnostic);
    }

    const ProcessResult result = runIptables("-A", rule);
    if (!result.succeeded())
    {
        QUAY_LOG_ERROR("failed to append rule '%s' - %s",
                       rule.toString().c_str(), result.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "iptables: " + result.diagnostic());
    }

    QUAY_LOG_DEBUG("appended rule '%s'", rule.toString().c_str());
    return PolicyResult::success();
}

PolicyResult IptablesBackend::deleteIfPresent(const IptablesRule& rule)
{
    std::string diagnostic;
    switch (checkRule(rule, &diagnostic))
    {
        case RuleState::Absent:
            return PolicyResult::success();

        case RuleState::Present:
            break;

        case RuleState::Error:
            QUAY_LOG_ERROR("failed to check rule '%s' - %s",
                           rule.toString().c_str(), diagnostic.c_str());
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "iptables: " + diagnostic);
    }

    const ProcessResult result = runIptables("-D", rule);
    if (!result.succeeded())
    {
        QUAY_LOG_ERROR("failed to delete rule '%s' - %s",
                       rule.toString().c_str(), result.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "iptables: " + result.diagnostic());
    }

    QUAY_LOG_DEBUG("deleted rule '%s'", rule.toString().c_str());
    return PolicyResult::success();
}
