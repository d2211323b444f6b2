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

#ifndef WRED_QUEUE_DISC_ITEM_H
#define WRED_QUEUE_DISC_ITEM_H

#include "ns3/address.h"
#include "ns3/ptr.h"
#include "ns3/queue-item.h"

namespace ns3
{

class Packet;

namespace wred
{

/**
 * \ingroup wred
 * \class WredQueueDiscItem
 * QueueDiscItem holding a packet of a numbered flow.  The flow identifier is
 * carried by a FlowIdTag on the packet, so that it can be read by the
 * WredFlowIdPacketFilter and survives the item.
 */
class WredQueueDiscItem : public QueueDiscItem
{
  public:
    /**
     * \brief Create an item and tag its packet with the flow identifier
     * \param p the packet
     * \param dest the destination address
     * \param protocol the protocol number
     * \param flowId the flow identifier
     */
    WredQueueDiscItem(Ptr<Packet> p, const Address& dest, uint16_t protocol, uint32_t flowId);
    ~WredQueueDiscItem() override;
    void AddHeader() override;
    /**
     * \return false; this queue disc drops and never marks
     */
    bool Mark() override;
    /**
     * \return the flow identifier given at construction
     */
    uint32_t GetFlowId() const;

  private:
    WredQueueDiscItem() = delete;
    WredQueueDiscItem(const WredQueueDiscItem&) = delete;
    WredQueueDiscItem& operator=(const WredQueueDiscItem&) = delete;
    uint32_t m_flowId;
};

} // namespace wred
} // namespace ns3

#endif /* WRED_QUEUE_DISC_ITEM_H */
