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

#include "red-drop-decision.h"

#include "ns3/abort.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("RedDropDecision");

namespace wred
{

std::ostream&
operator<<(std::ostream& os, RedVerdict verdict)
{
    switch (verdict)
    {
    case RedVerdict::ADMIT:
        os << "ADMIT";
        break;
    case RedVerdict::PROBABILISTIC_DROP:
        os << "PROBABILISTIC_DROP";
        break;
    case RedVerdict::FORCED_DROP:
        os << "FORCED_DROP";
        break;
    }
    return os;
}

RedDropDecision::RedDropDecision()
{
    NS_LOG_FUNCTION(this);
}

RedVerdict
RedDropDecision::Decide(double average,
                        const WredThresholds& thresholds,
                        double maxProbability,
                        Ptr<RandomVariableStream> uv)
{
    NS_LOG_FUNCTION(this << average << thresholds << maxProbability);
    NS_ABORT_MSG_IF(std::isnan(average) || average < 0, "Invalid average queue size " << average);
    if (average < thresholds.m_minTh)
    {
        NS_LOG_LOGIC("Average " << average << " below minTh " << thresholds.m_minTh);
        return RedVerdict::ADMIT;
    }
    // Also covers minTh == maxTh, where the early drop region is empty
    if (average >= thresholds.m_maxTh)
    {
        NS_LOG_LOGIC("Average " << average << " at or above maxTh " << thresholds.m_maxTh);
        m_count = 0;
        return RedVerdict::FORCED_DROP;
    }
    double pb = CalculateBaseProbability(average, thresholds, maxProbability);
    double pa = CalculateDropProbability(pb);
    double u = uv->GetValue();
    NS_LOG_LOGIC("pb " << pb << " count " << m_count << " pa " << pa << " u " << u);
    if (u < pa)
    {
        m_count = 0;
        return RedVerdict::PROBABILISTIC_DROP;
    }
    m_count++;
    return RedVerdict::ADMIT;
}

double
RedDropDecision::CalculateBaseProbability(double average,
                                          const WredThresholds& thresholds,
                                          double maxProbability)
{
    if (average < thresholds.m_minTh)
    {
        return 0;
    }
    if (average >= thresholds.m_maxTh)
    {
        return 1;
    }
    return maxProbability * (average - thresholds.m_minTh) /
           (thresholds.m_maxTh - thresholds.m_minTh);
}

double
RedDropDecision::CalculateDropProbability(double baseProbability) const
{
    double denominator = 1.0 - m_count * baseProbability;
    double pa = (denominator > 0) ? baseProbability / denominator : 1.0;
    pa = std::min(std::max(pa, 0.0), 1.0);
    NS_ABORT_MSG_IF(std::isnan(pa) || pa < 0 || pa > 1, "Check for an invalid value " << pa);
    return pa;
}

uint32_t
RedDropDecision::GetCount() const
{
    return m_count;
}

void
RedDropDecision::Reset()
{
    NS_LOG_FUNCTION(this);
    m_count = 0;
}

} // namespace wred
} // namespace ns3
