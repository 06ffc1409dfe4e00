/*
 *  Status request example for local Motion gateway client
 *
 *  Lists the blinds attached to a gateway named in the settings file and
 *  prints the state of each of them.
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
#include "motionConfig.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>


void print_blind(motionCover *cover)
{
	std::cout << "  blind " << cover->getMac() << " (" << cover->getDeviceType() << ")\n";
	std::cout << "    type: " << Motion::toString(cover->getType()) << "\n";
	std::cout << "    wireless mode: " << Motion::toString(cover->getWirelessMode()) << "\n";
	std::cout << "    available: " << (cover->isAvailable() ? "yes" : "no") << "\n";

	motionBlind *blind = dynamic_cast<motionBlind*>(cover);
	if (blind)
	{
		std::cout << "    status: " << Motion::toString(blind->getStatus()) << "\n";
		std::cout << "    limits: " << Motion::toString(blind->getLimitStatus()) << "\n";
		std::cout << "    position: " << blind->getPosition() << "\n";
		std::cout << "    angle: " << blind->getAngle() << "\n";
		double level;
		if (blind->getBatteryLevel(level))
			std::cout << "    battery: " << level << "% (" << blind->getBatteryVoltage() << "V)\n";
		else
			std::cout << "    battery: mains powered\n";
		return;
	}

	motionTDBU *tdbu = dynamic_cast<motionTDBU*>(cover);
	if (tdbu)
	{
		std::cout << "    position top: " << tdbu->getPosition(Motion::Motor::Top) << "\n";
		std::cout << "    position bottom: " << tdbu->getPosition(Motion::Motor::Bottom) << "\n";
		std::cout << "    position combined: " << tdbu->getPosition(Motion::Motor::Combined) << "\n";
		std::cout << "    width: " << tdbu->getWidth() << "\n";
		std::cout << "    battery top: " << tdbu->getBatteryVoltage(Motion::Motor::Top) << "V\n";
		std::cout << "    battery bottom: " << tdbu->getBatteryVoltage(Motion::Motor::Bottom) << "V\n";
	}
}


int main(int argc, char *argv[])
{
	if (argc < 2) {
		fprintf(stderr,"usage %s gatewayname\n", argv[0]);
		exit(0);
	}

#ifdef APPDEBUG
	Motion::Log::setLevel(Motion::Log::Level::Debug);
#endif

	Motion::Config::Settings settings;
	Motion::Config::GatewayEntry gateway_entry;
	try
	{
		settings = Motion::Config::LoadConfig();
	}
	catch (const Motion::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}
	if (!Motion::Config::FindGateway(settings, std::string(argv[1]), gateway_entry))
	{
		std::cout << "Error: Gateway unknown\n";
		exit(0);
	}

	motionGateway gateway(gateway_entry.address, gateway_entry.key);
	gateway.setTimeout(settings.timeout_ms);
	gateway.setInterface(settings.interface);

	try
	{
		gateway.Refresh();
		std::cout << "gateway " << gateway.getMac() << " at " << gateway.getAddress() << "\n";
		std::cout << "  protocol: " << gateway.getProtocolVersion() << "\n";
		std::cout << "  status: " << Motion::toString(gateway.getStatus()) << "\n";
		std::cout << "  devices: " << gateway.getDeviceCount() << "\n";
		std::cout << "  RSSI: " << gateway.getRSSI() << "\n";

		std::map<std::string, motionCover*> covers = gateway.getCovers();
		for (const std::pair<const std::string, motionCover*> &cover : covers)
		{
			cover.second->RefreshFromCache();
			print_blind(cover.second);
		}
	}
	catch (const Motion::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	return 0;
}
