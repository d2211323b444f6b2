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

#include "ns3/attribute.h"
#include "ns3/data-rate.h"
#include "ns3/double.h"
#include "ns3/log.h"
#include "ns3/queue-size.h"
#include "ns3/red-congestion-controller.h"
#include "ns3/uinteger.h"
#include "ns3/wred-flow-id-packet-filter.h"
#include "ns3/wred-policy-map.h"
#include "ns3/wred-queue-disc.h"
#include "wred-helper.h"

#include <iomanip>

namespace ns3 {

NS_LOG_COMPONENT_DEFINE ("WredHelper");

namespace wred {

WredHelper::WredHelper ()
{
  m_queueDiscFactory.SetTypeId ("ns3::wred::WredQueueDisc");
  m_controllerFactory.SetTypeId ("ns3::wred::RedCongestionController");
}

void
WredHelper::SetQueueDiscAttribute (std::string n1, const AttributeValue &v1)
{
  m_queueDiscFactory.Set (n1, v1);
}

void
WredHelper::SetControllerAttribute (std::string n1, const AttributeValue &v1)
{
  m_controllerFactory.Set (n1, v1);
}

Ptr<WredQueueDisc>
WredHelper::Create (const std::map<uint32_t, uint16_t>& priorities) const
{
  NS_LOG_FUNCTION (this << priorities.size ());
  Ptr<WredQueueDisc> queue = m_queueDiscFactory.Create<WredQueueDisc> ();
  Ptr<RedCongestionController> controller = m_controllerFactory.Create<RedCongestionController> ();
  queue->SetCongestionController (controller);
  queue->AddPacketFilter (CreateObject<WredFlowIdPacketFilter> ());
  queue->SetPriorities (priorities);
  return queue;
}

void
WredHelper::PrintConfiguration (std::ostream& ostr, Ptr<WredQueueDisc> queue) const
{
  Ptr<RedCongestionController> controller = queue->GetCongestionController ();

  DoubleValue dVal;
  UintegerValue uVal;
  QueueSizeValue qVal;
  DataRateValue rVal;

  std::streamsize oldPrecision = ostr.precision ();

  ostr << "Queue configuration" << std::endl;
  ostr << "-------------------" << std::endl;
  queue->GetAttribute ("MaxSize", qVal);
  ostr << "MaxSize: Queue limit (packet or byte mode) = " << qVal.Get () << std::endl;
  queue->GetAttribute ("NumPriorities", uVal);
  ostr << "NumPriorities: Number of priority classes = " << uVal.Get () << std::endl;
  queue->GetAttribute ("MaxThreshold", uVal);
  ostr << "MaxThreshold: Maximum threshold (percent of MaxSize) = " << uVal.Get () << std::endl;
  ostr << "Flows with a priority class assigned = " << queue->GetPriorities ().size () << std::endl;
  ostr << std::endl;

  ostr << "RED parameters" << std::endl;
  ostr << "--------------" << std::endl;
  controller->GetAttribute ("MaxProbability", dVal);
  ostr << "MaxProbability: Drop probability at the maximum threshold = " << dVal.Get () << std::endl;
  controller->GetAttribute ("WeightFactor", uVal);
  ostr << "WeightFactor: Exponent of the average queue size weight = " << uVal.Get () << std::endl;
  controller->GetAttribute ("LinkBandwidth", rVal);
  ostr << "LinkBandwidth: Link rate (bits/sec) = " << rVal.Get ().GetBitRate () << std::endl;
  controller->GetAttribute ("SmallPacketSize", uVal);
  ostr << "SmallPacketSize: Idle cycle packet size (bytes) = " << uVal.Get () << std::endl;
  ostr << "Idle cycle duration = " << controller->GetPacketTime ().As (Time::US) << std::endl;
  ostr << std::endl;

  ostr << "Calculated parameters: policy map" << std::endl;
  ostr << "---------------------------------" << std::endl;
  // An initialized queue disc prints the policies in use; otherwise the
  // policies are derived from the configuration without applying them
  WredPolicyMap policyMap;
  if (queue->IsInitialized ())
    {
      policyMap = queue->GetPolicyMap ();
    }
  else
    {
      WredConfigStatus status = queue->BuildPolicyMap (policyMap);
      if (status != WredConfigStatus::OK)
        {
          ostr << "Invalid configuration: " << status << std::endl;
          return;
        }
    }
  double capacity = queue->GetMaxSize ().GetValue ();
  ostr << std::fixed << std::setprecision (2);
  for (const auto& policy : policyMap.GetPolicies ())
    {
      WredThresholds scaled = WredPolicyMap::Scale (policy.second, capacity);
      ostr << "Class " << policy.first
           << ": min " << policy.second.m_minTh * 100 << "% (" << scaled.m_minTh << ")"
           << ", max " << policy.second.m_maxTh * 100 << "% (" << scaled.m_maxTh << ")"
           << std::endl;
    }
  ostr << std::setprecision (oldPrecision);
  ostr.unsetf (std::ios_base::fixed);
}

} // namespace wred
} // namespace ns3
