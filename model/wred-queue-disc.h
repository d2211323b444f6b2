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

#ifndef WRED_QUEUE_DISC_H
#define WRED_QUEUE_DISC_H

#include "red-congestion-controller.h"
#include "red-drop-decision.h"
#include "wred-policy-map.h"

#include "ns3/queue-disc.h"
#include "ns3/traced-callback.h"

#include <map>
#include <tuple>

namespace ns3
{
namespace wred
{

/**
 * \ingroup wred
 *
 * \brief Weighted RED queue discipline
 *
 * A single FIFO protected by one RedCongestionController.  Each arriving
 * packet is classified to a flow identifier by the installed packet filter
 * (a WredFlowIdPacketFilter is added if none is configured), the flow
 * identifier is mapped to a priority class, and the thresholds of that class
 * are used for the early drop decision.  The average queue size and the
 * count since the last drop are shared by all classes.
 *
 * The queue operates in byte or packet mode depending on the unit of the
 * MaxSize attribute; thresholds are scaled to that limit.
 *
 * Every flow that reaches the queue must have a priority class assigned;
 * a packet of an unassigned flow is a fatal error.
 */
class WredQueueDisc : public QueueDisc
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    /**
     * \brief WredQueueDisc constructor
     */
    WredQueueDisc();
    /**
     * \brief WredQueueDisc destructor
     */
    ~WredQueueDisc() override;

    /**
     * \brief Set the priority class of each flow
     *
     * Must be called before the queue disc is initialized.
     * \param priorities map from flow identifier to priority class
     */
    void SetPriorities(const std::map<uint32_t, uint16_t>& priorities);
    /**
     * \return the priority class of each flow
     */
    const std::map<uint32_t, uint16_t>& GetPriorities() const;

    /**
     * \brief Override the default policy of one priority class
     *
     * Overrides are applied when the configuration is checked, on top of the
     * evenly spaced default policies.  The class must exist in the default
     * map.
     * \param priorityClass the priority class
     * \param minThreshold minimum threshold, percentage of the queue limit
     * \param maxThreshold maximum threshold, percentage of the queue limit
     */
    void AddPolicy(uint16_t priorityClass, uint32_t minThreshold, uint32_t maxThreshold);

    /**
     * \param controller the congestion controller shared by all classes
     */
    void SetCongestionController(Ptr<RedCongestionController> controller);
    /**
     * \return the congestion controller shared by all classes
     */
    Ptr<RedCongestionController> GetCongestionController() const;

    /**
     * \return the policy map built by the last configuration check
     */
    const WredPolicyMap& GetPolicyMap() const;

    /**
     * \brief Resolve the priority class of a flow
     * \param flowId the flow identifier
     * \param priorityClass set to the class if the flow is assigned
     * \return false if the flow has no priority class
     */
    bool LookupPriority(uint32_t flowId, uint16_t& priorityClass) const;

    /**
     * \brief Get the thresholds of a priority class in queue units
     * \param priorityClass the priority class
     * \param thresholds set to the thresholds scaled to the queue limit
     * \return false if the class is absent from the policy map
     */
    bool GetThresholds(uint16_t priorityClass, WredThresholds& thresholds) const;

    /**
     * \brief Derive the policy map of the current configuration
     *
     * Applies the overrides to the default policies and checks the
     * configuration, without touching the policy map in use.
     * \param policyMap set to the derived policies
     * \return WredConfigStatus::OK, or the first problem found
     */
    WredConfigStatus BuildPolicyMap(WredPolicyMap& policyMap) const;

    /**
     * \brief Build the policy map and check the configuration
     *
     * Called from CheckConfig(); exposed so that a configuration can be
     * verified before the simulation starts.  The policy map in use is
     * replaced only if the configuration is valid.
     * \return WredConfigStatus::OK, or the first problem found
     */
    WredConfigStatus ValidateConfig();

    /**
     * \return the current occupancy, in the unit of the queue limit
     */
    double GetQueueSize() const;

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this model.  Return the number of streams (possibly zero) that
     * have been assigned.
     *
     * \param stream first stream index to use
     * \return the number of stream indices assigned by this model
     */
    int64_t AssignStreams(int64_t stream);

    /**
     * TracedCallback signature for the per-packet policy outcome
     *
     * \param [in] flowId the flow identifier of the packet
     * \param [in] priorityClass the priority class of the flow
     * \param [in] verdict the outcome for the packet
     */
    typedef void (*PolicyVerdictTracedCallback)(uint32_t flowId,
                                                uint16_t priorityClass,
                                                RedVerdict verdict);

    // Reasons for dropping packets
    static constexpr const char* UNFORCED_DROP = "Unforced drop"; //!< Early drop
    static constexpr const char* FORCED_DROP = "Forced drop";     //!< Average above max threshold
    static constexpr const char* QUEUE_LIMIT_DROP = "Queue limit drop"; //!< Queue full

  protected:
    /**
     * \brief Dispose of the object
     */
    void DoDispose() override;

  private:
    bool DoEnqueue(Ptr<QueueDiscItem> item) override;
    Ptr<QueueDiscItem> DoDequeue() override;
    Ptr<const QueueDiscItem> DoPeek() override;
    bool CheckConfig() override;
    void InitializeParams() override;

    // Variables tied to attributes do not need default initializers
    uint16_t m_numPriorities; //!< Number of priority classes
    uint32_t m_maxThreshold;  //!< Maximum threshold, percentage of the queue limit

    std::map<uint32_t, uint16_t> m_priorities; //!< Priority class per flow
    std::map<uint16_t, std::tuple<uint32_t, uint32_t>> m_customPolicies; //!< Overrides
    WredPolicyMap m_policyMap;                 //!< Thresholds per priority class
    Ptr<RedCongestionController> m_controller; //!< Shared RED state

    /**
     * The trace source fired upon each enqueue decision
     */
    TracedCallback<uint32_t, uint16_t, RedVerdict> m_policyVerdictTrace;
};

} // namespace wred
} // namespace ns3

#endif /* WRED_QUEUE_DISC_H */
