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

#include "ns3/data-rate.h"
#include "ns3/double.h"
#include "ns3/flow-id-tag.h"
#include "ns3/log.h"
#include "ns3/packet.h"
#include "ns3/queue-size.h"
#include "ns3/random-variable-stream.h"
#include "ns3/red-congestion-controller.h"
#include "ns3/simulator.h"
#include "ns3/test.h"
#include "ns3/uinteger.h"
#include "ns3/wred-helper.h"
#include "ns3/wred-queue-disc-item.h"
#include "ns3/wred-queue-disc.h"

#include <cmath>
#include <map>
#include <sstream>

using namespace ns3;
using namespace wred;

NS_LOG_COMPONENT_DEFINE("WredQueueDiscTestSuite");

/**
 * \ingroup wred
 *
 * Configuration checks performed before the queue disc starts
 */
class WredQueueDiscConfigTestCase : public TestCase
{
  public:
    WredQueueDiscConfigTestCase();

  private:
    void DoRun() override;
};

WredQueueDiscConfigTestCase::WredQueueDiscConfigTestCase()
    : TestCase("Check the validation of the WRED configuration")
{
}

void
WredQueueDiscConfigTestCase::DoRun()
{
    Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc>();
    queue->SetAttribute("MaxSize", QueueSizeValue(QueueSize("100p")));
    queue->SetAttribute("NumPriorities", UintegerValue(8));
    queue->SetAttribute("MaxThreshold", UintegerValue(40));

    std::map<uint32_t, uint16_t> priorities;
    priorities[1] = 7;
    priorities[2] = 9;
    queue->SetPriorities(priorities);
    NS_TEST_EXPECT_MSG_EQ(queue->ValidateConfig(),
                          WredConfigStatus::UNKNOWN_PRIORITY_CLASS,
                          "Class 9 does not exist with 8 classes");

    priorities.erase(2);
    queue->SetPriorities(priorities);
    NS_TEST_EXPECT_MSG_EQ(queue->ValidateConfig(), WredConfigStatus::OK, "Valid configuration");

    uint16_t priorityClass = 0;
    NS_TEST_EXPECT_MSG_EQ(queue->LookupPriority(1, priorityClass), true, "Flow 1 is assigned");
    NS_TEST_EXPECT_MSG_EQ(priorityClass, 7, "Flow 1 belongs to class 7");
    NS_TEST_EXPECT_MSG_EQ(queue->LookupPriority(2, priorityClass),
                          false,
                          "Flow 2 is not assigned");

    // Default thresholds scaled to 100 packets: class 0 from 20 to 40
    WredThresholds thresholds;
    NS_TEST_ASSERT_MSG_EQ(queue->GetThresholds(0, thresholds), true, "Class 0 exists");
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_minTh, 20, 1e-9, "Class 0 minimum threshold");
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_maxTh, 40, 1e-9, "Class 0 maximum threshold");
    NS_TEST_EXPECT_MSG_EQ(queue->GetThresholds(8, thresholds), false, "Class 8 does not exist");

    // Custom policy on top of the defaults
    queue->AddPolicy(0, 10, 20);
    NS_TEST_EXPECT_MSG_EQ(queue->ValidateConfig(), WredConfigStatus::OK, "Valid override");
    queue->GetThresholds(0, thresholds);
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_minTh, 10, 1e-9, "Overridden minimum threshold");
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_maxTh, 20, 1e-9, "Overridden maximum threshold");

    queue->AddPolicy(12, 10, 20);
    NS_TEST_EXPECT_MSG_EQ(queue->ValidateConfig(),
                          WredConfigStatus::UNKNOWN_PRIORITY_CLASS,
                          "Override of a class that does not exist");

    Ptr<WredQueueDisc> badPolicy = CreateObject<WredQueueDisc>();
    badPolicy->AddPolicy(1, 30, 20);
    NS_TEST_EXPECT_MSG_EQ(badPolicy->ValidateConfig(),
                          WredConfigStatus::INVALID_THRESHOLD,
                          "Override with the minimum above the maximum");

    Ptr<WredQueueDisc> badThreshold = CreateObject<WredQueueDisc>();
    badThreshold->SetAttribute("MaxThreshold", UintegerValue(150));
    NS_TEST_EXPECT_MSG_EQ(badThreshold->ValidateConfig(),
                          WredConfigStatus::INVALID_THRESHOLD,
                          "Threshold above 100 percent");

    Ptr<WredQueueDisc> noClass = CreateObject<WredQueueDisc>();
    noClass->SetAttribute("NumPriorities", UintegerValue(0));
    NS_TEST_EXPECT_MSG_EQ(noClass->ValidateConfig(),
                          WredConfigStatus::INVALID_PRIORITY_COUNT,
                          "No priority class");

    Ptr<WredQueueDisc> badProbability = CreateObject<WredQueueDisc>();
    badProbability->GetCongestionController()->SetAttribute("MaxProbability", DoubleValue(0));
    NS_TEST_EXPECT_MSG_EQ(badProbability->ValidateConfig(),
                          WredConfigStatus::INVALID_PROBABILITY,
                          "Zero maximum probability");
    badProbability->GetCongestionController()->SetAttribute("MaxProbability", DoubleValue(1.5));
    NS_TEST_EXPECT_MSG_EQ(badProbability->ValidateConfig(),
                          WredConfigStatus::INVALID_PROBABILITY,
                          "Maximum probability above one");

    Simulator::Destroy();
}

/**
 * \ingroup wred
 *
 * Base fixture recording the verdicts reported by a queue disc
 */
class WredQueueDiscTestBase : public TestCase
{
  public:
    /**
     * Constructor
     * \param name test case name
     */
    WredQueueDiscTestBase(std::string name);

  protected:
    /**
     * Record a verdict
     * \param flowId flow identifier
     * \param priorityClass priority class
     * \param verdict verdict
     */
    void PolicyVerdictTrace(uint32_t flowId, uint16_t priorityClass, RedVerdict verdict);
    /**
     * Enqueue a packet of a flow
     * \param queue the queue disc
     * \param flowId flow identifier
     * \param size packet size in bytes
     * \return the value returned by the queue disc
     */
    bool EnqueuePacket(Ptr<WredQueueDisc> queue, uint32_t flowId, uint32_t size);

    std::map<uint16_t, uint32_t> m_admits;      //!< Admits per class
    std::map<uint16_t, uint32_t> m_earlyDrops;  //!< Early drops per class
    std::map<uint16_t, uint32_t> m_forcedDrops; //!< Forced drops per class
};

WredQueueDiscTestBase::WredQueueDiscTestBase(std::string name)
    : TestCase(name)
{
}

void
WredQueueDiscTestBase::PolicyVerdictTrace([[maybe_unused]] uint32_t flowId,
                                          uint16_t priorityClass,
                                          RedVerdict verdict)
{
    switch (verdict)
    {
    case RedVerdict::ADMIT:
        m_admits[priorityClass]++;
        break;
    case RedVerdict::PROBABILISTIC_DROP:
        m_earlyDrops[priorityClass]++;
        break;
    case RedVerdict::FORCED_DROP:
        m_forcedDrops[priorityClass]++;
        break;
    }
}

bool
WredQueueDiscTestBase::EnqueuePacket(Ptr<WredQueueDisc> queue, uint32_t flowId, uint32_t size)
{
    Ptr<Packet> p = Create<Packet>(size);
    return queue->Enqueue(Create<WredQueueDiscItem>(p, Address(), 0, flowId));
}

/**
 * \ingroup wred
 *
 * Classes sharing the same average get different verdicts
 */
class WredQueueDiscDifferentiationTestCase : public WredQueueDiscTestBase
{
  public:
    WredQueueDiscDifferentiationTestCase();

  private:
    void DoRun() override;
};

WredQueueDiscDifferentiationTestCase::WredQueueDiscDifferentiationTestCase()
    : WredQueueDiscTestBase("Check the differentiation of two classes sharing one average")
{
}

void
WredQueueDiscDifferentiationTestCase::DoRun()
{
    // Four classes at 40 percent of 100 packets: class 0 from 20 to 40,
    // class 3 from 35 to 40
    Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc>();
    queue->SetAttribute("MaxSize", QueueSizeValue(QueueSize("100p")));
    queue->SetAttribute("NumPriorities", UintegerValue(4));
    queue->SetAttribute("MaxThreshold", UintegerValue(40));
    Ptr<RedCongestionController> controller = queue->GetCongestionController();
    controller->SetAttribute("WeightFactor", UintegerValue(1));
    // A draw of zero drops whenever the drop probability is positive
    Ptr<ConstantRandomVariable> rv = CreateObject<ConstantRandomVariable>();
    rv->SetAttribute("Constant", DoubleValue(0));
    controller->SetRandomVariable(rv);

    std::map<uint32_t, uint16_t> priorities;
    priorities[10] = 0;
    priorities[13] = 3;
    queue->SetPriorities(priorities);
    queue->TraceConnectWithoutContext(
        "PolicyVerdict",
        MakeCallback(&WredQueueDiscDifferentiationTestCase::PolicyVerdictTrace, this));
    queue->Initialize();

    // Empty queue: class 0 is admitted
    NS_TEST_EXPECT_MSG_EQ(EnqueuePacket(queue, 10, 500), true, "Class 0 admitted when empty");

    // Build up the occupancy with class 3; the average trails the
    // occupancy by about two packets with a weight of 1/2
    for (uint32_t i = 0; i < 25; i++)
    {
        NS_TEST_ASSERT_MSG_EQ(EnqueuePacket(queue, 13, 500), true, "Class 3 admitted");
    }
    NS_TEST_EXPECT_MSG_EQ(queue->GetQueueSize(), 26, "Occupancy in packets");
    NS_TEST_ASSERT_MSG_GT(controller->GetAverage(), 20, "Average above class 0 minimum");
    NS_TEST_ASSERT_MSG_LT(controller->GetAverage(), 35, "Average below class 3 minimum");

    for (uint32_t i = 0; i < 5; i++)
    {
        NS_TEST_EXPECT_MSG_EQ(EnqueuePacket(queue, 10, 500), false, "Class 0 dropped early");
        NS_TEST_EXPECT_MSG_EQ(EnqueuePacket(queue, 13, 500), true, "Class 3 admitted");
    }
    NS_TEST_EXPECT_MSG_LT(controller->GetAverage(), 35, "Average still below class 3 minimum");

    NS_TEST_EXPECT_MSG_EQ(m_admits[0], 1, "Class 0 admits");
    NS_TEST_EXPECT_MSG_EQ(m_earlyDrops[0], 5, "Class 0 early drops");
    NS_TEST_EXPECT_MSG_EQ(m_admits[3], 30, "Class 3 admits");
    NS_TEST_EXPECT_MSG_EQ(m_earlyDrops[3], 0, "Class 3 early drops");
    NS_TEST_EXPECT_MSG_EQ(queue->GetStats().GetNDroppedPackets(WredQueueDisc::UNFORCED_DROP),
                          5,
                          "Early drops accounted in the queue disc statistics");
    NS_TEST_EXPECT_MSG_EQ(queue->GetCurrentSize().GetValue(), 31, "Occupancy in packets");

    // FIFO service
    Ptr<QueueDiscItem> item = queue->Dequeue();
    NS_TEST_ASSERT_MSG_EQ((item != nullptr), true, "Packet available");
    FlowIdTag tag;
    item->GetPacket()->PeekPacketTag(tag);
    NS_TEST_EXPECT_MSG_EQ(tag.GetFlowId(), 10, "First packet served first");

    Simulator::Destroy();
}

/**
 * \ingroup wred
 *
 * The queue limit is enforced in packet and in byte mode
 */
class WredQueueDiscLimitTestCase : public WredQueueDiscTestBase
{
  public:
    WredQueueDiscLimitTestCase();

  private:
    void DoRun() override;
    /**
     * Fill a queue beyond its limit
     * \param mode the queue size unit
     */
    void RunLimitTest(QueueSizeUnit mode);
};

WredQueueDiscLimitTestCase::WredQueueDiscLimitTestCase()
    : WredQueueDiscTestBase("Check the queue limit in packet and byte mode")
{
}

void
WredQueueDiscLimitTestCase::RunLimitTest(QueueSizeUnit mode)
{
    m_admits.clear();
    m_earlyDrops.clear();
    m_forcedDrops.clear();

    uint32_t pktSize = 100;
    uint32_t modeSize = (mode == QueueSizeUnit::BYTES) ? pktSize : 1;
    Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc>();
    queue->SetAttribute("MaxSize", QueueSizeValue(QueueSize(mode, 10 * modeSize)));
    queue->SetAttribute("NumPriorities", UintegerValue(1));
    queue->SetAttribute("MaxThreshold", UintegerValue(100));
    // The average hardly moves, so only the queue limit drops packets
    queue->GetCongestionController()->SetAttribute("WeightFactor", UintegerValue(31));
    std::map<uint32_t, uint16_t> priorities;
    priorities[1] = 0;
    queue->SetPriorities(priorities);
    queue->TraceConnectWithoutContext(
        "PolicyVerdict",
        MakeCallback(&WredQueueDiscLimitTestCase::PolicyVerdictTrace, this));
    queue->Initialize();

    WredThresholds thresholds;
    queue->GetThresholds(0, thresholds);
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_minTh,
                              5 * modeSize,
                              1e-9,
                              "Minimum threshold in queue units");
    NS_TEST_EXPECT_MSG_EQ_TOL(thresholds.m_maxTh,
                              10 * modeSize,
                              1e-9,
                              "Maximum threshold in queue units");

    for (uint32_t i = 0; i < 15; i++)
    {
        EnqueuePacket(queue, 1, pktSize);
    }
    NS_TEST_EXPECT_MSG_EQ(queue->GetQueueSize(), 10 * modeSize, "Queue full");
    NS_TEST_EXPECT_MSG_EQ(m_admits[0], 10, "Admitted up to the limit");
    NS_TEST_EXPECT_MSG_EQ(m_forcedDrops[0], 5, "Dropped beyond the limit");
    NS_TEST_EXPECT_MSG_EQ(queue->GetStats().GetNDroppedPackets(WredQueueDisc::QUEUE_LIMIT_DROP),
                          5,
                          "Queue limit drops accounted in the queue disc statistics");

    for (uint32_t i = 0; i < 10; i++)
    {
        NS_TEST_ASSERT_MSG_EQ((queue->Dequeue() != nullptr), true, "Packet available");
    }
    NS_TEST_EXPECT_MSG_EQ((queue->Dequeue() == nullptr), true, "Queue drained");
    Simulator::Destroy();
}

void
WredQueueDiscLimitTestCase::DoRun()
{
    RunLimitTest(QueueSizeUnit::PACKETS);
    RunLimitTest(QueueSizeUnit::BYTES);
}

/**
 * \ingroup wred
 *
 * The average decays across an idle period
 */
class WredQueueDiscIdleTestCase : public WredQueueDiscTestBase
{
  public:
    WredQueueDiscIdleTestCase();

  private:
    void DoRun() override;
    /**
     * Enqueue a packet and record the average
     * \param queue the queue disc
     */
    void Arrive(Ptr<WredQueueDisc> queue);
    /**
     * Drain the queue
     * \param queue the queue disc
     */
    void Drain(Ptr<WredQueueDisc> queue);

    double m_averageBeforeIdle{0}; //!< Average when the queue became empty
    double m_averageAfterIdle{0};  //!< Average after the first arrival
};

WredQueueDiscIdleTestCase::WredQueueDiscIdleTestCase()
    : WredQueueDiscTestBase("Check the decay of the average across an idle period")
{
}

void
WredQueueDiscIdleTestCase::Arrive(Ptr<WredQueueDisc> queue)
{
    EnqueuePacket(queue, 1, 1000);
    m_averageAfterIdle = queue->GetCongestionController()->GetAverage();
}

void
WredQueueDiscIdleTestCase::Drain(Ptr<WredQueueDisc> queue)
{
    m_averageBeforeIdle = queue->GetCongestionController()->GetAverage();
    while (queue->Dequeue())
    {
    }
}

void
WredQueueDiscIdleTestCase::DoRun()
{
    // 125 bytes at 1 Mbps: one idle cycle per millisecond
    Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc>();
    queue->SetAttribute("MaxSize", QueueSizeValue(QueueSize("100p")));
    queue->SetAttribute("NumPriorities", UintegerValue(1));
    queue->SetAttribute("MaxThreshold", UintegerValue(100));
    Ptr<RedCongestionController> controller = queue->GetCongestionController();
    controller->SetAttribute("WeightFactor", UintegerValue(1));
    controller->SetAttribute("LinkBandwidth", DataRateValue(DataRate("1Mbps")));
    controller->SetAttribute("SmallPacketSize", UintegerValue(125));
    std::map<uint32_t, uint16_t> priorities;
    priorities[1] = 0;
    queue->SetPriorities(priorities);
    queue->Initialize();
    NS_TEST_EXPECT_MSG_EQ_TOL(controller->GetPacketTime().GetSeconds(),
                              0.001,
                              1e-9,
                              "Idle cycle duration");

    for (uint32_t i = 0; i < 10; i++)
    {
        Simulator::Schedule(MilliSeconds(i), &WredQueueDiscIdleTestCase::Arrive, this, queue);
    }
    Simulator::Schedule(Seconds(1), &WredQueueDiscIdleTestCase::Drain, this, queue);
    // 3.5 ms of idle time: three cycles
    Simulator::Schedule(Seconds(1) + MicroSeconds(3500),
                        &WredQueueDiscIdleTestCase::Arrive,
                        this,
                        queue);
    Simulator::Run();

    NS_TEST_ASSERT_MSG_GT(m_averageBeforeIdle, 5, "Average built up before the idle period");
    NS_TEST_EXPECT_MSG_EQ_TOL(m_averageAfterIdle,
                              m_averageBeforeIdle * std::pow(0.5, 3),
                              1e-9,
                              "Average decayed over three idle cycles");
    NS_TEST_EXPECT_MSG_EQ(queue->GetQueueSize(), 1, "Arrival after the idle period admitted");
    Simulator::Destroy();
}

/**
 * \ingroup wred
 *
 * A dropped arrival at an empty queue does not end the idle period
 */
class WredQueueDiscDroppedArrivalTestCase : public WredQueueDiscTestBase
{
  public:
    WredQueueDiscDroppedArrivalTestCase();

  private:
    void DoRun() override;
    /**
     * Enqueue a packet of a flow and record the average
     * \param queue the queue disc
     * \param flowId flow identifier
     * \param average set to the average after the arrival
     */
    void Arrive(Ptr<WredQueueDisc> queue, uint32_t flowId, double* average);
    /**
     * Drain the queue without further polling
     * \param queue the queue disc
     */
    void Drain(Ptr<WredQueueDisc> queue);

    double m_averageBeforeIdle{0}; //!< Average when the queue became empty
    double m_averageFirstDrop{0};  //!< Average after the first dropped arrival
    double m_averageSecondDrop{0}; //!< Average after the second dropped arrival
    double m_averageBusy{0};       //!< Average after a packet of the busy regime
};

WredQueueDiscDroppedArrivalTestCase::WredQueueDiscDroppedArrivalTestCase()
    : WredQueueDiscTestBase("Check that dropped arrivals keep an empty queue idle")
{
}

void
WredQueueDiscDroppedArrivalTestCase::Arrive(Ptr<WredQueueDisc> queue,
                                            uint32_t flowId,
                                            double* average)
{
    EnqueuePacket(queue, flowId, 1000);
    if (average)
    {
        *average = queue->GetCongestionController()->GetAverage();
    }
}

void
WredQueueDiscDroppedArrivalTestCase::Drain(Ptr<WredQueueDisc> queue)
{
    m_averageBeforeIdle = queue->GetCongestionController()->GetAverage();
    uint32_t packets = queue->GetNPackets();
    for (uint32_t i = 0; i < packets; i++)
    {
        queue->Dequeue();
    }
}

void
WredQueueDiscDroppedArrivalTestCase::DoRun()
{
    // Class 1 drops every packet; one idle cycle per millisecond
    Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc>();
    queue->SetAttribute("MaxSize", QueueSizeValue(QueueSize("100p")));
    queue->SetAttribute("NumPriorities", UintegerValue(2));
    queue->SetAttribute("MaxThreshold", UintegerValue(100));
    queue->AddPolicy(1, 0, 0);
    Ptr<RedCongestionController> controller = queue->GetCongestionController();
    controller->SetAttribute("WeightFactor", UintegerValue(1));
    controller->SetAttribute("LinkBandwidth", DataRateValue(DataRate("1Mbps")));
    controller->SetAttribute("SmallPacketSize", UintegerValue(125));
    std::map<uint32_t, uint16_t> priorities;
    priorities[1] = 0;
    priorities[2] = 1;
    queue->SetPriorities(priorities);
    queue->TraceConnectWithoutContext(
        "PolicyVerdict",
        MakeCallback(&WredQueueDiscDroppedArrivalTestCase::PolicyVerdictTrace, this));
    queue->Initialize();

    for (uint32_t i = 0; i < 10; i++)
    {
        Simulator::Schedule(MilliSeconds(i),
                            &WredQueueDiscDroppedArrivalTestCase::Arrive,
                            this,
                            queue,
                            1,
                            nullptr);
    }
    // The queue is drained at 1 s and nothing dequeues afterwards
    Simulator::Schedule(Seconds(1), &WredQueueDiscDroppedArrivalTestCase::Drain, this, queue);
    Simulator::Schedule(Seconds(1) + MilliSeconds(2),
                        &WredQueueDiscDroppedArrivalTestCase::Arrive,
                        this,
                        queue,
                        2,
                        &m_averageFirstDrop);
    Simulator::Schedule(Seconds(1) + MilliSeconds(5),
                        &WredQueueDiscDroppedArrivalTestCase::Arrive,
                        this,
                        queue,
                        2,
                        &m_averageSecondDrop);
    // An admitted packet ends the idle period
    Simulator::Schedule(Seconds(1) + MilliSeconds(6),
                        &WredQueueDiscDroppedArrivalTestCase::Arrive,
                        this,
                        queue,
                        1,
                        nullptr);
    Simulator::Schedule(Seconds(1) + MilliSeconds(9),
                        &WredQueueDiscDroppedArrivalTestCase::Arrive,
                        this,
                        queue,
                        1,
                        &m_averageBusy);
    Simulator::Run();

    NS_TEST_ASSERT_MSG_GT(m_averageBeforeIdle, 5, "Average built up before the idle period");
    NS_TEST_EXPECT_MSG_EQ(m_forcedDrops[1], 2, "Both packets of class 1 dropped");
    NS_TEST_EXPECT_MSG_EQ(m_admits[0], 12, "All packets of class 0 admitted");
    NS_TEST_EXPECT_MSG_EQ_TOL(m_averageFirstDrop,
                              m_averageBeforeIdle * std::pow(0.5, 2),
                              1e-9,
                              "Average decayed over two idle cycles");
    NS_TEST_EXPECT_MSG_EQ_TOL(m_averageSecondDrop,
                              m_averageFirstDrop * std::pow(0.5, 3),
                              1e-9,
                              "Idle period restarted by the dropped arrival");
    // Busy sample with one packet queued: (avg + 1) / 2
    double afterAdmit = m_averageSecondDrop * 0.5;
    NS_TEST_EXPECT_MSG_EQ_TOL(m_averageBusy,
                              (afterAdmit + 1) * 0.5,
                              1e-9,
                              "Admitted packet ends the idle period");
    NS_TEST_EXPECT_MSG_EQ(queue->GetQueueSize(), 2, "Two packets of class 0 queued");
    Simulator::Destroy();
}

/**
 * \ingroup wred
 *
 * The helper builds a ready to use queue disc
 */
class WredHelperTestCase : public WredQueueDiscTestBase
{
  public:
    WredHelperTestCase();

  private:
    void DoRun() override;
};

WredHelperTestCase::WredHelperTestCase()
    : WredQueueDiscTestBase("Check the creation and printing of a queue disc by the helper")
{
}

void
WredHelperTestCase::DoRun()
{
    WredHelper helper;
    helper.SetQueueDiscAttribute("MaxSize", QueueSizeValue(QueueSize("1000p")));
    helper.SetQueueDiscAttribute("NumPriorities", UintegerValue(4));
    helper.SetControllerAttribute("MaxProbability", DoubleValue(0.2));
    std::map<uint32_t, uint16_t> priorities;
    priorities[5] = 2;
    Ptr<WredQueueDisc> queue = helper.Create(priorities);

    DoubleValue maxP;
    queue->GetCongestionController()->GetAttribute("MaxProbability", maxP);
    NS_TEST_EXPECT_MSG_EQ_TOL(maxP.Get(), 0.2, 1e-12, "Controller attribute applied");
    NS_TEST_EXPECT_MSG_EQ(queue->GetNPacketFilters(), 1, "Flow identifier filter installed");
    NS_TEST_EXPECT_MSG_EQ(queue->GetPriorities().size(), 1, "Priorities installed");

    std::ostringstream oss;
    helper.PrintConfiguration(oss, queue);
    NS_TEST_EXPECT_MSG_NE(oss.str().find("Class 3: min 35.00% (350.00), max 40.00% (400.00)"),
                          std::string::npos,
                          "Thresholds of class 3 printed");
    NS_TEST_EXPECT_MSG_EQ(queue->GetPolicyMap().GetNPolicies(),
                          0,
                          "Printing does not build the policy map in use");

    queue->Initialize();
    NS_TEST_EXPECT_MSG_EQ(queue->GetPolicyMap().GetNPolicies(), 4, "Policy map built");
    NS_TEST_EXPECT_MSG_EQ(EnqueuePacket(queue, 5, 100), true, "Packet of flow 5 admitted");

    // Printing a running queue disc reports the policies in use
    std::ostringstream running;
    helper.PrintConfiguration(running, queue);
    NS_TEST_EXPECT_MSG_NE(running.str().find("Class 3: min 35.00% (350.00), max 40.00% (400.00)"),
                          std::string::npos,
                          "Thresholds of class 3 printed after initialization");
    NS_TEST_EXPECT_MSG_EQ(queue->GetPolicyMap().GetNPolicies(), 4, "Policy map unchanged");
    NS_TEST_EXPECT_MSG_EQ(queue->GetQueueSize(), 1, "Queued packet unaffected by printing");
    Simulator::Destroy();
}

static class WredQueueDiscTestSuite : public TestSuite
{
  public:
    WredQueueDiscTestSuite()
        : TestSuite("wred-queue-disc", UNIT)
    {
        AddTestCase(new WredQueueDiscConfigTestCase(), TestCase::QUICK);
        AddTestCase(new WredQueueDiscDifferentiationTestCase(), TestCase::QUICK);
        AddTestCase(new WredQueueDiscLimitTestCase(), TestCase::QUICK);
        AddTestCase(new WredQueueDiscIdleTestCase(), TestCase::QUICK);
        AddTestCase(new WredQueueDiscDroppedArrivalTestCase(), TestCase::QUICK);
        AddTestCase(new WredHelperTestCase(), TestCase::QUICK);
    }
} g_wredQueueDiscTestSuite;
