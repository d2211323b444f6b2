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

#include "wred-queue-disc.h"

#include "wred-flow-id-packet-filter.h"

#include "ns3/abort.h"
#include "ns3/drop-tail-queue.h"
#include "ns3/log.h"
#include "ns3/packet-filter.h"
#include "ns3/uinteger.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WredQueueDisc");

namespace wred
{

NS_OBJECT_ENSURE_REGISTERED(WredQueueDisc);

TypeId
WredQueueDisc::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wred::WredQueueDisc")
            .SetParent<QueueDisc>()
            .SetGroupName("Wred")
            .AddConstructor<WredQueueDisc>()
            .AddAttribute("MaxSize",
                          "The maximum number of packets (or bytes) accepted by this queue disc; "
                          "the unit selects packet or byte mode",
                          QueueSizeValue(QueueSize("25p")),
                          MakeQueueSizeAccessor(&QueueDisc::SetMaxSize, &QueueDisc::GetMaxSize),
                          MakeQueueSizeChecker())
            .AddAttribute("NumPriorities",
                          "Number of priority classes of the default policy map",
                          UintegerValue(8),
                          MakeUintegerAccessor(&WredQueueDisc::m_numPriorities),
                          MakeUintegerChecker<uint16_t>())
            .AddAttribute("MaxThreshold",
                          "Maximum threshold shared by all priority classes, as a percentage "
                          "of MaxSize; minimum thresholds are spread between half of it and it",
                          UintegerValue(40),
                          MakeUintegerAccessor(&WredQueueDisc::m_maxThreshold),
                          MakeUintegerChecker<uint32_t>())
            .AddTraceSource("PolicyVerdict",
                            "Report the flow, priority class and verdict of each arrival",
                            MakeTraceSourceAccessor(&WredQueueDisc::m_policyVerdictTrace),
                            "ns3::wred::WredQueueDisc::PolicyVerdictTracedCallback");
    return tid;
}

WredQueueDisc::WredQueueDisc()
    : QueueDisc(QueueDiscSizePolicy::SINGLE_INTERNAL_QUEUE)
{
    NS_LOG_FUNCTION(this);
    m_controller = CreateObject<RedCongestionController>();
}

WredQueueDisc::~WredQueueDisc()
{
    NS_LOG_FUNCTION(this);
}

void
WredQueueDisc::DoDispose()
{
    NS_LOG_FUNCTION(this);
    if (m_controller)
    {
        m_controller->Dispose();
        m_controller = nullptr;
    }
    QueueDisc::DoDispose();
}

void
WredQueueDisc::SetPriorities(const std::map<uint32_t, uint16_t>& priorities)
{
    NS_LOG_FUNCTION(this << priorities.size());
    NS_ABORT_MSG_IF(IsInitialized(), "Priorities must be set before the queue disc starts");
    m_priorities = priorities;
}

const std::map<uint32_t, uint16_t>&
WredQueueDisc::GetPriorities() const
{
    return m_priorities;
}

void
WredQueueDisc::AddPolicy(uint16_t priorityClass, uint32_t minThreshold, uint32_t maxThreshold)
{
    NS_LOG_FUNCTION(this << priorityClass << minThreshold << maxThreshold);
    NS_ABORT_MSG_IF(IsInitialized(), "Policies must be added before the queue disc starts");
    m_customPolicies[priorityClass] = std::make_tuple(minThreshold, maxThreshold);
}

void
WredQueueDisc::SetCongestionController(Ptr<RedCongestionController> controller)
{
    NS_LOG_FUNCTION(this << controller);
    NS_ABORT_MSG_UNLESS(controller, "Congestion controller must not be null");
    m_controller = controller;
}

Ptr<RedCongestionController>
WredQueueDisc::GetCongestionController() const
{
    return m_controller;
}

const WredPolicyMap&
WredQueueDisc::GetPolicyMap() const
{
    return m_policyMap;
}

bool
WredQueueDisc::LookupPriority(uint32_t flowId, uint16_t& priorityClass) const
{
    auto it = m_priorities.find(flowId);
    if (it == m_priorities.end())
    {
        return false;
    }
    priorityClass = it->second;
    return true;
}

bool
WredQueueDisc::GetThresholds(uint16_t priorityClass, WredThresholds& thresholds) const
{
    WredThresholds fractions;
    if (!m_policyMap.Lookup(priorityClass, fractions))
    {
        return false;
    }
    thresholds = WredPolicyMap::Scale(fractions, GetMaxSize().GetValue());
    return true;
}

WredConfigStatus
WredQueueDisc::BuildPolicyMap(WredPolicyMap& policyMap) const
{
    NS_LOG_FUNCTION(this);
    WredConfigStatus status = policyMap.SetMap(m_numPriorities, m_maxThreshold);
    if (status != WredConfigStatus::OK)
    {
        return status;
    }
    for (const auto& policy : m_customPolicies)
    {
        if (!policyMap.HasPolicy(policy.first))
        {
            NS_LOG_LOGIC("Custom policy for unknown class " << policy.first);
            return WredConfigStatus::UNKNOWN_PRIORITY_CLASS;
        }
        status = policyMap.AddPolicy(policy.first,
                                       std::get<0>(policy.second),
                                       std::get<1>(policy.second));
        if (status != WredConfigStatus::OK)
        {
            return status;
        }
    }
    double maxP = m_controller->GetMaxProbability();
    if (!(maxP > 0 && maxP <= 1))
    {
        return WredConfigStatus::INVALID_PROBABILITY;
    }
    for (const auto& assignment : m_priorities)
    {
        if (!policyMap.HasPolicy(assignment.second))
        {
            NS_LOG_LOGIC("Flow " << assignment.first << " assigned to unknown class "
                                 << assignment.second);
            return WredConfigStatus::UNKNOWN_PRIORITY_CLASS;
        }
    }
    return WredConfigStatus::OK;
}

WredConfigStatus
WredQueueDisc::ValidateConfig()
{
    NS_LOG_FUNCTION(this);
    WredPolicyMap policyMap;
    WredConfigStatus status = BuildPolicyMap(policyMap);
    if (status == WredConfigStatus::OK)
    {
        m_policyMap = policyMap;
    }
    return status;
}

double
WredQueueDisc::GetQueueSize() const
{
    if (GetNInternalQueues() == 0)
    {
        return 0;
    }
    return GetInternalQueue(0)->GetCurrentSize().GetValue();
}

int64_t
WredQueueDisc::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    return m_controller->AssignStreams(stream);
}

bool
WredQueueDisc::DoEnqueue(Ptr<QueueDiscItem> item)
{
    NS_LOG_FUNCTION(this << item);

    int32_t ret = Classify(item);
    if (ret == PacketFilter::PF_NO_MATCH)
    {
        NS_FATAL_ERROR("Packet " << item->GetPacket()->GetUid()
                                 << " does not carry a flow identifier");
    }
    uint32_t flowId = static_cast<uint32_t>(ret);
    uint16_t priorityClass = 0;
    if (!LookupPriority(flowId, priorityClass))
    {
        NS_FATAL_ERROR("Flow " << flowId << " has no priority class assigned");
    }

    WredThresholds thresholds;
    if (!GetThresholds(priorityClass, thresholds))
    {
        NS_FATAL_ERROR("No policy for priority class " << priorityClass);
    }
    m_controller->SetThresholds(thresholds);

    // The average is sampled with the occupancy seen by the arriving packet
    RedVerdict verdict = m_controller->Decide(GetQueueSize());
    NS_LOG_DEBUG("Flow " << flowId << " class " << priorityClass << " qSize " << GetQueueSize()
                         << " avg " << m_controller->GetAverage() << " count "
                         << m_controller->GetCount() << " " << thresholds << " -> " << verdict);

    const char* reason = nullptr;
    if (verdict == RedVerdict::PROBABILISTIC_DROP)
    {
        reason = UNFORCED_DROP;
    }
    else if (verdict == RedVerdict::FORCED_DROP)
    {
        reason = FORCED_DROP;
    }
    else if (GetCurrentSize() + item > GetMaxSize())
    {
        NS_LOG_LOGIC("Queue full -- dropping pkt");
        verdict = RedVerdict::FORCED_DROP;
        reason = QUEUE_LIMIT_DROP;
    }

    if (reason)
    {
        m_policyVerdictTrace(flowId, priorityClass, verdict);
        DropBeforeEnqueue(item, reason);
        // A dropped arrival leaves an empty queue idle
        if (GetInternalQueue(0)->IsEmpty())
        {
            m_controller->NotifyIdle();
        }
        return false;
    }

    m_policyVerdictTrace(flowId, priorityClass, verdict);
    bool retval = GetInternalQueue(0)->Enqueue(item);

    // If Queue::Enqueue fails, QueueDisc::DropBeforeEnqueue is called by the
    // internal queue because QueueDisc::AddInternalQueue sets the trace callback
    NS_LOG_LOGIC("Number packets " << GetInternalQueue(0)->GetNPackets());
    NS_LOG_LOGIC("Number bytes " << GetInternalQueue(0)->GetNBytes());
    return retval;
}

Ptr<QueueDiscItem>
WredQueueDisc::DoDequeue()
{
    NS_LOG_FUNCTION(this);

    Ptr<QueueDiscItem> item = GetInternalQueue(0)->Dequeue();
    if (!item)
    {
        NS_LOG_LOGIC("Queue empty");
        m_controller->NotifyIdle();
        return nullptr;
    }
    if (GetInternalQueue(0)->IsEmpty())
    {
        NS_LOG_LOGIC("Queue became empty");
        m_controller->NotifyIdle();
    }
    NS_LOG_LOGIC("Popped " << item);
    return item;
}

Ptr<const QueueDiscItem>
WredQueueDisc::DoPeek()
{
    NS_LOG_FUNCTION(this);
    return GetInternalQueue(0)->Peek();
}

bool
WredQueueDisc::CheckConfig()
{
    NS_LOG_FUNCTION(this);
    if (GetNQueueDiscClasses() > 0)
    {
        NS_LOG_ERROR("WredQueueDisc cannot have classes");
        return false;
    }

    if (GetNPacketFilters() == 0)
    {
        NS_LOG_LOGIC("Installing the flow identifier packet filter");
        AddPacketFilter(CreateObject<WredFlowIdPacketFilter>());
    }

    if (GetNInternalQueues() == 0)
    {
        NS_LOG_LOGIC("Setting queue size to " << GetMaxSize());
        AddInternalQueue(CreateObjectWithAttributes<DropTailQueue<QueueDiscItem>>(
            "MaxSize",
            QueueSizeValue(GetMaxSize())));
    }

    if (GetNInternalQueues() != 1)
    {
        NS_LOG_ERROR("WredQueueDisc needs 1 internal queue");
        return false;
    }

    WredConfigStatus status = ValidateConfig();
    if (status != WredConfigStatus::OK)
    {
        NS_LOG_ERROR("Invalid WRED configuration: " << status);
        return false;
    }
    return true;
}

void
WredQueueDisc::InitializeParams()
{
    NS_LOG_FUNCTION(this);
    m_controller->Reset();
    for (const auto& policy : m_policyMap.GetPolicies())
    {
        WredThresholds scaled = WredPolicyMap::Scale(policy.second, GetMaxSize().GetValue());
        NS_LOG_INFO("Class " << policy.first << " " << policy.second << " -> " << scaled);
    }
}

} // namespace wred
} // namespace ns3
