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
 * File:   NftablesBackend.cpp
 *
 */
#include "NftablesBackend.h"
#include "IProcessRunner.h"
#include "RuleRenderer.h"

#include <Logging.h>
#include <FileUtilities.h>


NftablesBackend::NftablesBackend(const std::shared_ptr<IProcessRunner>& runner,
                                 const std::string& nftPath,
                                 const std::string& rulesetPath)
    : mRunner(runner)
    , mNftPath(nftPath)
    , mRulesetPath(rulesetPath)
{
}

NatBackend NftablesBackend::type() const
{
    return NatBackend::Nftables;
}

std::string NftablesBackend::render(const PolicyState& state) const
{
    return RuleRenderer::renderNftables(state);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Writes the rendered document and loads it.
 *
 *  This is the equivalent of the following on the command line
 *
 *      nft -f /etc/quay/quay.nft
 *
 *  The previous state isn't needed, the document replaces our tables
 *  wholesale.
 */
PolicyResult NftablesBackend::apply(const PolicyState& desired,
                                    const PolicyState* previous)
{
    QUAY_LOG_FN_ENTRY();

    (void)previous;

    const std::string document = RuleRenderer::renderNftables(desired);

    if (!QuayCommon::mkdirRecursive(QuayCommon::dirName(mRulesetPath), 0755) ||
        !QuayCommon::replaceFileAtomically(mRulesetPath, document, 0644))
    {
        QUAY_LOG_ERROR_EXIT("failed to write ruleset to '%s'", mRulesetPath.c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "failed to write ruleset to " + mRulesetPath);
    }

    const ProcessResult result = mRunner->run(mNftPath, { "-f", mRulesetPath });
    if (!result.succeeded())
    {
        QUAY_LOG_ERROR_EXIT("failed to load ruleset '%s' - %s",
                            mRulesetPath.c_str(), result.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "nft: " + result.diagnostic());
    }

    QUAY_LOG_INFO("loaded nftables ruleset (%zu port-maps, %zu ACLs)",
                  desired.portMaps.size(), desired.acls.size());

    QUAY_LOG_FN_EXIT();
    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes our tables and the well-known ruleset file, so that nothing
 *  can reload the stale rules later.
 *
 *      nft -f - <<< "table inet quay; delete table inet quay; ..."
 */
PolicyResult NftablesBackend::flush()
{
    QUAY_LOG_FN_ENTRY();

    const ProcessResult result =
        mRunner->run(mNftPath, { "-f", "-" }, RuleRenderer::renderNftablesFlush());
    if (!result.succeeded())
    {
        QUAY_LOG_ERROR_EXIT("failed to flush nftables tables - %s",
                            result.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "nft: " + result.diagnostic());
    }

    if (QuayCommon::exists(mRulesetPath) && !QuayCommon::deleteFile(mRulesetPath))
    {
        QUAY_LOG_WARN("failed to remove stale ruleset file '%s'", mRulesetPath.c_str());
    }

    QUAY_LOG_INFO("flushed nftables tables");

    QUAY_LOG_FN_EXIT();
    return PolicyResult::success();
}
