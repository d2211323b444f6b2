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

//
// This example drives a single WredQueueDisc with several flows of Poisson
// arrivals, each flow assigned to a priority class, and a server that
// removes packets at a fixed link rate.  When the offered load exceeds the
// link rate the average queue size rises, and the lower priority classes
// (lower class numbers) start to lose packets before the higher ones.
//
//  flow 0 (class 0) --\
//  flow 1 (class 1) ---\
//        ...            +---> [ WredQueueDisc ] ---> link (serviceRate)
//  flow N (class N) ---/
//
// The program provides the following command-line arguments:
//    --numFlows:          Number of flows, one per priority class [4]
//    --numPriorities:     Number of priority classes of the policy map [4]
//    --maxThreshold:      Maximum threshold (percent of queue size) [40]
//    --maxProbability:    Drop probability at the maximum threshold [0.1]
//    --weightFactor:      Exponent of the average queue size weight [6]
//    --queueSize:         Queue limit, in packets (p) or bytes (B) [100p]
//    --packetSize:        Size of the generated packets (bytes) [1000]
//    --arrivalRate:       Mean packet rate of each flow (packets/s) [40]
//    --serviceRate:       Link rate [1Mbps]
//    --simulationTime:    Time to end the simulation [+20s]
//    --printConfig:       Print the queue configuration [true]
//
// Per-class admitted and dropped packet counts are printed at the end, with
// the queue disc statistics.
//

#include "ns3/core-module.h"
#include "ns3/network-module.h"
#include "ns3/traffic-control-module.h"
#include "ns3/wred-helper.h"
#include "ns3/wred-queue-disc-item.h"
#include "ns3/wred-queue-disc.h"

#include <iomanip>
#include <map>

using namespace ns3;
using namespace wred;

NS_LOG_COMPONENT_DEFINE("WredExample");

struct ClassCounters
{
    uint32_t m_admitted{0};
    uint32_t m_earlyDrops{0};
    uint32_t m_forcedDrops{0};
};

std::map<uint16_t, ClassCounters> g_counters;

void
PolicyVerdictTrace([[maybe_unused]] uint32_t flowId, uint16_t priorityClass, RedVerdict verdict)
{
    ClassCounters& counters = g_counters[priorityClass];
    switch (verdict)
    {
    case RedVerdict::ADMIT:
        counters.m_admitted++;
        break;
    case RedVerdict::PROBABILISTIC_DROP:
        counters.m_earlyDrops++;
        break;
    case RedVerdict::FORCED_DROP:
        counters.m_forcedDrops++;
        break;
    }
}

void
AverageQueueSizeTrace([[maybe_unused]] double oldValue, double newValue)
{
    NS_LOG_INFO(Simulator::Now().As(Time::S) << " average " << newValue);
}

void
GeneratePacket(Ptr<WredQueueDisc> queue,
               uint32_t flowId,
               uint32_t packetSize,
               Ptr<ExponentialRandomVariable> interArrival,
               Time stopTime)
{
    Ptr<Packet> p = Create<Packet>(packetSize);
    queue->Enqueue(Create<WredQueueDiscItem>(p, Address(), 0, flowId));
    Time next = Seconds(interArrival->GetValue());
    if (Simulator::Now() + next < stopTime)
    {
        Simulator::Schedule(next,
                            &GeneratePacket,
                            queue,
                            flowId,
                            packetSize,
                            interArrival,
                            stopTime);
    }
}

void
ServePacket(Ptr<WredQueueDisc> queue, DataRate serviceRate, uint32_t packetSize, Time stopTime)
{
    Ptr<QueueDiscItem> item = queue->Dequeue();
    // An empty queue is polled again after one packet time
    Time next = serviceRate.CalculateBytesTxTime(item ? item->GetSize() : packetSize);
    if (Simulator::Now() + next < stopTime)
    {
        Simulator::Schedule(next, &ServePacket, queue, serviceRate, packetSize, stopTime);
    }
}

int
main(int argc, char* argv[])
{
    uint32_t numFlows = 4;
    uint16_t numPriorities = 4;
    uint32_t maxThreshold = 40;
    double maxProbability = 0.1;
    uint32_t weightFactor = 6;
    std::string queueSize = "100p";
    uint32_t packetSize = 1000;
    double arrivalRate = 40;
    DataRate serviceRate("1Mbps");
    Time simulationTime = Seconds(20);
    bool printConfig = true;

    CommandLine cmd;
    cmd.AddValue("numFlows", "Number of flows, one per priority class", numFlows);
    cmd.AddValue("numPriorities", "Number of priority classes of the policy map", numPriorities);
    cmd.AddValue("maxThreshold", "Maximum threshold (percent of queue size)", maxThreshold);
    cmd.AddValue("maxProbability", "Drop probability at the maximum threshold", maxProbability);
    cmd.AddValue("weightFactor", "Exponent of the average queue size weight", weightFactor);
    cmd.AddValue("queueSize", "Queue limit, in packets (p) or bytes (B)", queueSize);
    cmd.AddValue("packetSize", "Size of the generated packets (bytes)", packetSize);
    cmd.AddValue("arrivalRate", "Mean packet rate of each flow (packets/s)", arrivalRate);
    cmd.AddValue("serviceRate", "Link rate", serviceRate);
    cmd.AddValue("simulationTime", "Time to end the simulation", simulationTime);
    cmd.AddValue("printConfig", "Print the queue configuration", printConfig);
    cmd.Parse(argc, argv);

    NS_ABORT_MSG_IF(numFlows == 0, "At least one flow is needed");
    NS_ABORT_MSG_IF(arrivalRate <= 0, "Arrival rate must be positive");

    // Flow i is assigned to class i, wrapping around the number of classes
    std::map<uint32_t, uint16_t> priorities;
    for (uint32_t flowId = 0; flowId < numFlows; flowId++)
    {
        priorities[flowId] = static_cast<uint16_t>(flowId % numPriorities);
    }

    WredHelper wredHelper;
    wredHelper.SetQueueDiscAttribute("MaxSize", QueueSizeValue(QueueSize(queueSize)));
    wredHelper.SetQueueDiscAttribute("NumPriorities", UintegerValue(numPriorities));
    wredHelper.SetQueueDiscAttribute("MaxThreshold", UintegerValue(maxThreshold));
    wredHelper.SetControllerAttribute("MaxProbability", DoubleValue(maxProbability));
    wredHelper.SetControllerAttribute("WeightFactor", UintegerValue(weightFactor));
    wredHelper.SetControllerAttribute("LinkBandwidth", DataRateValue(serviceRate));
    Ptr<WredQueueDisc> queue = wredHelper.Create(priorities);
    queue->AssignStreams(1);

    queue->TraceConnectWithoutContext("PolicyVerdict", MakeCallback(&PolicyVerdictTrace));
    queue->GetCongestionController()->TraceConnectWithoutContext(
        "AverageQueueSize",
        MakeCallback(&AverageQueueSizeTrace));
    queue->Initialize();

    if (printConfig)
    {
        wredHelper.PrintConfiguration(std::cout, queue);
        std::cout << std::endl;
    }

    Time stopTime = Seconds(0) + simulationTime;
    for (uint32_t flowId = 0; flowId < numFlows; flowId++)
    {
        Ptr<ExponentialRandomVariable> interArrival = CreateObject<ExponentialRandomVariable>();
        interArrival->SetAttribute("Mean", DoubleValue(1 / arrivalRate));
        interArrival->SetStream(10 + flowId);
        Simulator::Schedule(Seconds(interArrival->GetValue()),
                            &GeneratePacket,
                            queue,
                            flowId,
                            packetSize,
                            interArrival,
                            stopTime);
    }
    Simulator::Schedule(Seconds(0), &ServePacket, queue, serviceRate, packetSize, stopTime);

    Simulator::Stop(stopTime);
    Simulator::Run();

    std::cout << "Per-class outcome" << std::endl;
    std::cout << "-----------------" << std::endl;
    std::cout << std::setw(6) << "class" << std::setw(10) << "admitted" << std::setw(12)
              << "early drop" << std::setw(13) << "forced drop" << std::setw(11) << "drop ratio"
              << std::endl;
    for (const auto& entry : g_counters)
    {
        const ClassCounters& c = entry.second;
        uint32_t total = c.m_admitted + c.m_earlyDrops + c.m_forcedDrops;
        double ratio = total ? static_cast<double>(c.m_earlyDrops + c.m_forcedDrops) / total : 0;
        std::cout << std::setw(6) << entry.first << std::setw(10) << c.m_admitted << std::setw(12)
                  << c.m_earlyDrops << std::setw(13) << c.m_forcedDrops << std::setw(11)
                  << std::fixed << std::setprecision(3) << ratio << std::endl;
    }
    std::cout << std::endl << queue->GetStats() << std::endl;

    Simulator::Destroy();
    return 0;
}
