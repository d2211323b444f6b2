/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2020 Cable Television Laboratories, Inc.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions, and the following disclaimer,
 *    without modification.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 * 3. The names of the authors may not be used to endorse or promote products
 *    derived from this software without specific prior written permission.
 *
 * Alternatively, provided that this notice is retained in full, this
 * software may be distributed under the terms of the GNU General
 * Public License ("GPL") version 2, in which case the provisions of the
 * GPL apply INSTEAD OF those given above.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "wred-policy-map.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WredPolicyMap");

namespace wred
{

std::ostream&
operator<<(std::ostream& os, WredConfigStatus status)
{
    switch (status)
    {
    case WredConfigStatus::OK:
        os << "OK";
        break;
    case WredConfigStatus::INVALID_THRESHOLD:
        os << "INVALID_THRESHOLD";
        break;
    case WredConfigStatus::INVALID_PRIORITY_COUNT:
        os << "INVALID_PRIORITY_COUNT";
        break;
    case WredConfigStatus::INVALID_PROBABILITY:
        os << "INVALID_PROBABILITY";
        break;
    case WredConfigStatus::UNKNOWN_PRIORITY_CLASS:
        os << "UNKNOWN_PRIORITY_CLASS";
        break;
    }
    return os;
}

std::ostream&
operator<<(std::ostream& os, const WredThresholds& thresholds)
{
    os << "minTh: " << thresholds.m_minTh << " maxTh: " << thresholds.m_maxTh;
    return os;
}

WredPolicyMap::WredPolicyMap()
{
    NS_LOG_FUNCTION(this);
}

WredConfigStatus
WredPolicyMap::SetMap(uint16_t numPriorities, uint32_t maxThreshold)
{
    NS_LOG_FUNCTION(this << numPriorities << maxThreshold);
    m_policies.clear();
    if (numPriorities == 0)
    {
        NS_LOG_ERROR("At least one priority class is required");
        return WredConfigStatus::INVALID_PRIORITY_COUNT;
    }
    if (maxThreshold > 100)
    {
        NS_LOG_ERROR("Maximum threshold " << maxThreshold << " is not a percentage");
        return WredConfigStatus::INVALID_THRESHOLD;
    }
    // Integer arithmetic in percent; a step of zero is allowed and makes
    // several classes share a minimum threshold
    uint32_t minThreshold = maxThreshold / 2;
    uint32_t stepSize = (maxThreshold - minThreshold) / numPriorities;
    NS_LOG_LOGIC("Base minimum threshold " << minThreshold << "% step " << stepSize << "%");
    for (uint16_t priorityClass = 0; priorityClass < numPriorities; priorityClass++)
    {
        WredConfigStatus status = AddPolicy(priorityClass, minThreshold, maxThreshold);
        if (status != WredConfigStatus::OK)
        {
            m_policies.clear();
            return status;
        }
        minThreshold += stepSize;
    }
    return WredConfigStatus::OK;
}

WredConfigStatus
WredPolicyMap::AddPolicy(uint16_t priorityClass, uint32_t minThreshold, uint32_t maxThreshold)
{
    NS_LOG_FUNCTION(this << priorityClass << minThreshold << maxThreshold);
    if (minThreshold > maxThreshold || maxThreshold > 100)
    {
        NS_LOG_ERROR("Invalid threshold setting for class " << priorityClass << ": "
                                                            << minThreshold << "% to "
                                                            << maxThreshold << "%");
        return WredConfigStatus::INVALID_THRESHOLD;
    }
    WredThresholds thresholds;
    thresholds.m_minTh = minThreshold / 100.0;
    thresholds.m_maxTh = maxThreshold / 100.0;
    m_policies[priorityClass] = thresholds;
    NS_LOG_LOGIC("Policy for class " << priorityClass << " " << thresholds);
    return WredConfigStatus::OK;
}

bool
WredPolicyMap::Lookup(uint16_t priorityClass, WredThresholds& thresholds) const
{
    auto it = m_policies.find(priorityClass);
    if (it == m_policies.end())
    {
        NS_LOG_LOGIC("No policy for class " << priorityClass);
        return false;
    }
    thresholds = it->second;
    return true;
}

bool
WredPolicyMap::HasPolicy(uint16_t priorityClass) const
{
    return m_policies.find(priorityClass) != m_policies.end();
}

std::size_t
WredPolicyMap::GetNPolicies() const
{
    return m_policies.size();
}

const std::map<uint16_t, WredThresholds>&
WredPolicyMap::GetPolicies() const
{
    return m_policies;
}

WredThresholds
WredPolicyMap::Scale(const WredThresholds& thresholds, double capacity)
{
    WredThresholds scaled;
    scaled.m_minTh = thresholds.m_minTh * capacity;
    scaled.m_maxTh = thresholds.m_maxTh * capacity;
    return scaled;
}

} // namespace wred
} // namespace ns3
