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

#include "red-average-estimator.h"

#include "ns3/abort.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("RedAverageEstimator");

namespace wred
{

RedAverageEstimator::RedAverageEstimator()
    : m_idleStart(Seconds(0))
{
    NS_LOG_FUNCTION(this);
    SetWeightFactor(6);
}

void
RedAverageEstimator::SetWeightFactor(uint32_t weightFactor)
{
    NS_LOG_FUNCTION(this << weightFactor);
    NS_ABORT_MSG_IF(weightFactor == 0, "Weight factor must be at least 1");
    m_weightFactor = weightFactor;
    m_weight = std::pow(2.0, -1.0 * weightFactor);
}

uint32_t
RedAverageEstimator::GetWeightFactor() const
{
    return m_weightFactor;
}

double
RedAverageEstimator::GetWeight() const
{
    return m_weight;
}

double
RedAverageEstimator::GetAverage() const
{
    return m_average;
}

double
RedAverageEstimator::Update(double sample)
{
    NS_LOG_FUNCTION(this << sample);
    m_average = m_average * (1.0 - m_weight) + sample * m_weight;
    CheckAverage();
    return m_average;
}

double
RedAverageEstimator::Decay(uint32_t cycles)
{
    NS_LOG_FUNCTION(this << cycles);
    m_average *= std::pow(1.0 - m_weight, cycles);
    CheckAverage();
    return m_average;
}

void
RedAverageEstimator::NotifyIdle(Time now)
{
    NS_LOG_FUNCTION(this << now);
    if (!m_idle)
    {
        m_idle = true;
        m_idleStart = now;
    }
}

bool
RedAverageEstimator::IsIdle() const
{
    return m_idle;
}

double
RedAverageEstimator::Sample(double sample, Time now, Time packetTime)
{
    NS_LOG_FUNCTION(this << sample << now << packetTime);
    if (m_idle)
    {
        NS_ABORT_MSG_IF(now < m_idleStart, "Arrival precedes the start of the idle period");
        m_idle = false;
        uint32_t cycles = 1;
        if (packetTime.IsStrictlyPositive())
        {
            int64_t idleCycles = (now - m_idleStart).GetTimeStep() / packetTime.GetTimeStep();
            idleCycles = std::min<int64_t>(idleCycles, std::numeric_limits<uint32_t>::max());
            cycles = std::max<uint32_t>(static_cast<uint32_t>(idleCycles), 1);
        }
        NS_LOG_LOGIC("Idle for " << (now - m_idleStart).As(Time::US) << "; decay over " << cycles
                                 << " cycles");
        return Decay(cycles);
    }
    return Update(sample);
}

void
RedAverageEstimator::Reset()
{
    NS_LOG_FUNCTION(this);
    m_average = 0;
    m_idle = true;
    m_idleStart = Seconds(0);
}

void
RedAverageEstimator::CheckAverage() const
{
    NS_ABORT_MSG_IF(std::isnan(m_average) || m_average < 0,
                    "Invalid average queue size " << m_average);
}

} // namespace wred
} // namespace ns3
