/*
 * test_configuration.cpp
 *
 * Copyright (C) 2023 The ISDBScanner Authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <catch2/catch.hpp>

#include "configuration.h"

TEST_CASE("configuration")
{
	Configuration *configuration = Configuration::instance();

	SECTION("terrestrial channel range") {
		configuration->setTerrestrialChannelRange(20, 30);
		REQUIRE(configuration->getFirstTerrestrialChannel() == 20);
		REQUIRE(configuration->getLastTerrestrialChannel() == 30);

		configuration->setTerrestrialChannelRange(12, 30);
		configuration->setTerrestrialChannelRange(30, 20);
		configuration->setTerrestrialChannelRange(13, 63);
		REQUIRE(configuration->getFirstTerrestrialChannel() == 20);
		REQUIRE(configuration->getLastTerrestrialChannel() == 30);

		// stored in the config file
		Configuration::detach();
		configuration = Configuration::instance();
		REQUIRE(configuration->getFirstTerrestrialChannel() == 20);
		REQUIRE(configuration->getLastTerrestrialChannel() == 30);

		configuration->setTerrestrialChannelRange(13, 62);
	}

	SECTION("invalid values are rejected") {
		configuration->setTuneTimeout(5.5);
		configuration->setTuneTimeout(0);
		REQUIRE(configuration->getTuneTimeout() == Approx(5.5));

		configuration->setTerrestrialRecordingTime(6);
		configuration->setTerrestrialRecordingTime(-1);
		REQUIRE(configuration->getTerrestrialRecordingTime() == 6);

		configuration->setSatelliteRecordingTime(0);
		REQUIRE(configuration->getSatelliteRecordingTime() > 0);

		configuration->setMinimumOutputSize(64 * 1024);
		configuration->setMinimumOutputSize(-1);
		REQUIRE(configuration->getMinimumOutputSize() == 64 * 1024);

		configuration->setRecisdbPath(QLatin1String("/opt/recisdb/bin/recisdb"));
		configuration->setRecisdbPath(QString());
		REQUIRE(configuration->getRecisdbPath() == QLatin1String("/opt/recisdb/bin/recisdb"));
	}

	Configuration::detach();
}
