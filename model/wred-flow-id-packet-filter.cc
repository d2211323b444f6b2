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

#include "wred-flow-id-packet-filter.h"

#include "ns3/flow-id-tag.h"
#include "ns3/log.h"
#include "ns3/packet.h"
#include "ns3/queue-item.h"

#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WredFlowIdPacketFilter");

namespace wred
{

NS_OBJECT_ENSURE_REGISTERED(WredFlowIdPacketFilter);

TypeId
WredFlowIdPacketFilter::GetTypeId()
{
    static TypeId tid = TypeId("ns3::wred::WredFlowIdPacketFilter")
                            .SetParent<PacketFilter>()
                            .SetGroupName("Wred")
                            .AddConstructor<WredFlowIdPacketFilter>();
    return tid;
}

WredFlowIdPacketFilter::WredFlowIdPacketFilter()
{
    NS_LOG_FUNCTION(this);
}

WredFlowIdPacketFilter::~WredFlowIdPacketFilter()
{
    NS_LOG_FUNCTION(this);
}

bool
WredFlowIdPacketFilter::CheckProtocol(Ptr<QueueDiscItem> item) const
{
    NS_LOG_FUNCTION(this << item);
    FlowIdTag tag;
    return item->GetPacket()->PeekPacketTag(tag);
}

int32_t
WredFlowIdPacketFilter::DoClassify(Ptr<QueueDiscItem> item) const
{
    NS_LOG_FUNCTION(this << item);
    FlowIdTag tag;
    item->GetPacket()->PeekPacketTag(tag);
    uint32_t flowId = tag.GetFlowId();
    if (flowId > static_cast<uint32_t>(std::numeric_limits<int32_t>::max()))
    {
        NS_LOG_WARN("Flow id " << flowId << " out of classification range");
        return PacketFilter::PF_NO_MATCH;
    }
    NS_LOG_DEBUG("Flow id " << flowId);
    return static_cast<int32_t>(flowId);
}

} // namespace wred
} // namespace ns3
