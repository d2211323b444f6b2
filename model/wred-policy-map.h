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

#ifndef WRED_POLICY_MAP_H
#define WRED_POLICY_MAP_H

#include <cstdint>
#include <map>
#include <ostream>

namespace ns3
{
namespace wred
{

/**
 * \brief Enumeration of the configuration check outcomes
 */
enum class WredConfigStatus
{
    OK,                     /*!< Configuration accepted */
    INVALID_THRESHOLD,      /*!< Threshold percentage outside [0, 100], or min above max */
    INVALID_PRIORITY_COUNT, /*!< No priority class configured */
    INVALID_PROBABILITY,    /*!< Maximum drop probability outside (0, 1] */
    UNKNOWN_PRIORITY_CLASS, /*!< Reference to a priority class absent from the policy map */
};

/**
 * \brief Stream insertion operator
 * \param os the stream
 * \param status the configuration status
 * \return a reference to the stream
 */
std::ostream& operator<<(std::ostream& os, WredConfigStatus status);

/**
 * \brief Minimum and maximum thresholds of the early drop region.
 *
 * Inside a WredPolicyMap the values are fractions of the queue limit
 * (percentage / 100).  Once scaled to a queue, they are expressed in the
 * unit of that queue (bytes or packets).
 */
struct WredThresholds
{
    double m_minTh{0}; //!< Average queue size at which early drops start
    double m_maxTh{0}; //!< Average queue size at which every packet is dropped
};

/**
 * \brief Stream insertion operator
 * \param os the stream
 * \param thresholds the threshold pair
 * \return a reference to the stream
 */
std::ostream& operator<<(std::ostream& os, const WredThresholds& thresholds);

/**
 * \ingroup wred
 *
 * \brief Policy map from priority class to WRED thresholds
 *
 * The default map holds one policy per priority class.  Every class shares
 * the same maximum threshold, and the minimum thresholds are spaced evenly
 * between half of the maximum threshold and the maximum threshold, with the
 * lowest class (0) dropping earliest.  When the number of classes exceeds
 * the spacing, several classes share the same minimum threshold.
 *
 * Thresholds are configured as integer percentages of the queue limit, and
 * stored as fractions.
 */
class WredPolicyMap
{
  public:
    WredPolicyMap();

    /**
     * \brief Replace the map with the evenly spaced default policies
     * \param numPriorities number of priority classes (at least one)
     * \param maxThreshold maximum threshold, percentage in [0, 100]
     * \return WredConfigStatus::OK, or the reason the map was rejected
     */
    WredConfigStatus SetMap(uint16_t numPriorities, uint32_t maxThreshold);

    /**
     * \brief Install or overwrite the policy of one priority class
     * \param priorityClass the priority class
     * \param minThreshold minimum threshold, percentage in [0, 100]
     * \param maxThreshold maximum threshold, percentage in [minThreshold, 100]
     * \return WredConfigStatus::OK, or WredConfigStatus::INVALID_THRESHOLD
     */
    WredConfigStatus AddPolicy(uint16_t priorityClass, uint32_t minThreshold, uint32_t maxThreshold);

    /**
     * \brief Get the thresholds of a priority class
     * \param priorityClass the priority class
     * \param thresholds set to the thresholds (fractions) if the class exists
     * \return false if the class was never installed
     */
    bool Lookup(uint16_t priorityClass, WredThresholds& thresholds) const;

    /**
     * \param priorityClass the priority class
     * \return true if a policy exists for the class
     */
    bool HasPolicy(uint16_t priorityClass) const;

    /**
     * \return the number of installed policies
     */
    std::size_t GetNPolicies() const;

    /**
     * \return the installed policies, ordered by priority class
     */
    const std::map<uint16_t, WredThresholds>& GetPolicies() const;

    /**
     * \brief Convert thresholds held as fractions to queue units
     * \param thresholds thresholds as fractions of the queue limit
     * \param capacity queue limit (bytes or packets)
     * \return thresholds in the unit of the queue limit
     */
    static WredThresholds Scale(const WredThresholds& thresholds, double capacity);

  private:
    std::map<uint16_t, WredThresholds> m_policies; //!< Policy per priority class
};

} // namespace wred
} // namespace ns3

#endif /* WRED_POLICY_MAP_H */
