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

#ifndef WRED_HELPER_H
#define WRED_HELPER_H

#include "ns3/object-factory.h"
#include "ns3/ptr.h"

#include <map>
#include <ostream>
#include <string>

namespace ns3 {

class AttributeValue;

namespace wred {

class WredQueueDisc;

/**
 * \ingroup wred
 * \brief Helper code for constructing WRED queue discs
 *
 * The helper creates a WredQueueDisc together with its
 * RedCongestionController, installs the flow identifier packet filter
 * and the priority assignment.  The queue disc returned is not yet
 * initialized; it can be attached to a TrafficControlLayer or driven
 * directly.
 *
 * This helper does not keep track of the queue discs it creates.
 */
class WredHelper
{
public:
  /**
   * Constructor
   */
  WredHelper ();
  /**
   * Destructor
   */
  virtual ~WredHelper () {}

  /**
   * Set an attribute value for the WredQueueDisc to be created.
   * This only has effect on queue discs created by future calls to the
   * Create() method.
   *
   * \param name the name of the attribute to set
   * \param value the value of the attribute to set
   */
  void SetQueueDiscAttribute (std::string name, const AttributeValue &value);

  /**
   * Set an attribute value for the RedCongestionController to be created.
   * This only has effect on controllers created by future calls to the
   * Create() method.
   *
   * \param name the name of the attribute to set
   * \param value the value of the attribute to set
   */
  void SetControllerAttribute (std::string name, const AttributeValue &value);

  /**
   * \brief Create a configured WRED queue disc
   * \param priorities map from flow identifier to priority class
   * \return the queue disc
   */
  Ptr<WredQueueDisc> Create (const std::map<uint32_t, uint16_t>& priorities) const;

  /**
   * \brief Print the configuration of a queue disc
   *
   * Prints the attributes of the queue disc and its controller, followed
   * by the thresholds of each priority class, as a percentage of the queue
   * limit and in queue units.  The policies of a queue disc that is not
   * yet initialized are derived from its configuration; the policy map it
   * uses is left untouched.
   *
   * \param ostr the output stream
   * \param queue the queue disc
   */
  void PrintConfiguration (std::ostream& ostr, Ptr<WredQueueDisc> queue) const;

private:
  ObjectFactory m_queueDiscFactory;  //!< Factory for the queue disc
  ObjectFactory m_controllerFactory; //!< Factory for the congestion controller
};

} // namespace wred
} // namespace ns3

#endif /* WRED_HELPER_H */
