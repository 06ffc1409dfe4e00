/*
 *  Monitor example for local Motion gateway client - multicast updates
 *
 *  Discovers all gateways listed in the settings file that answer on the
 *  local network and prints every state change they push, until
 *  interrupted.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionGateway.hpp"
#include "motionMulticast.hpp"
#include "motionDiscovery.hpp"
#include "motionMessage.hpp"
#include "motionConfig.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>
#include <memory>

std::atomic<bool> running(true);

void signal_handler(int)
{
	running = false;
}


int main(int argc, char *argv[])
{
	std::cout.setf(std::ios::unitbuf);  // Unbuffered output

#ifdef APPDEBUG
	Motion::Log::setLevel(Motion::Log::Level::Debug);
#else
	Motion::Log::setLevel(Motion::Log::Level::Info);
#endif

	Motion::Config::Settings settings;
	try
	{
		settings = Motion::Config::LoadConfig();
	}
	catch (const Motion::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	std::map<std::string, Json::Value> discovered;
	try
	{
		motionDiscovery discovery(settings.interface);
		discovered = discovery.discover(settings.discovery_window_ms);
	}
	catch (const Motion::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	motionMulticast multicast(settings.interface);
	std::vector<std::unique_ptr<motionGateway> > gateways;
	for (const std::pair<const std::string, Json::Value> &found : discovered)
	{
		Motion::Config::GatewayEntry entry;
		if (!Motion::Config::FindGateway(settings, found.first, entry))
		{
			std::cout << "Found gateway " << found.first << " (" << found.second["mac"].asString() << "), no key configured\n";
			continue;
		}

		std::unique_ptr<motionGateway> gateway(new motionGateway(entry.address, entry.key, &multicast));
		gateway->setTimeout(settings.timeout_ms);
		try
		{
			gateway->Refresh();
		}
		catch (const Motion::Error &e)
		{
			std::cout << "Gateway " << entry.address << ": " << e.what() << "\n";
			continue;
		}

		motionGateway *gw = gateway.get();
		gw->RegisterCallback("monitor", [gw]() {
			std::cout << "gateway " << gw->getMac() << ": " << Motion::toString(gw->getStatus()) << ", RSSI " << gw->getRSSI() << "\n";
		});
		for (const std::pair<const std::string, motionCover*> &cover : gw->getCovers())
		{
			motionCover *blind = cover.second;
			blind->RegisterCallback("monitor", [blind]() {
				Motion::CoverState state = blind->getState();
				std::cout << "blind " << blind->getMac() << ": position " << state.motor.position
					<< " top " << state.top.position << " bottom " << state.bottom.position
					<< " (" << Motion::toString(state.motor.status) << ")\n";
			});
		}
		std::cout << "Monitoring gateway " << gw->getMac() << " (" << entry.address << ") with " << gw->getCovers().size() << " blinds\n";
		gateways.push_back(std::move(gateway));
	}

	if (gateways.empty())
	{
		std::cout << "Error: no configured gateway found\n";
		exit(0);
	}

	signal(SIGINT, signal_handler);
	signal(SIGTERM, signal_handler);
	if (!multicast.Start())
		exit(1);

	std::cout << "Monitoring for updates (Ctrl-C to exit)...\n";
	while (running)
		std::this_thread::sleep_for(std::chrono::milliseconds(200));

	multicast.Stop();
	return 0;
}
