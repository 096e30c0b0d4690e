/*
 * test_tunermanager.cpp
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

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "isdb/isdbtunermanager.h"
#include "isdbtestutils.h"

static bool writeFile(const QString &fileName, const QByteArray &data)
{
	QFile file(fileName);

	if (!file.open(QIODevice::WriteOnly)) {
		return false;
	}

	return (file.write(data) == data.size());
}

TEST_CASE("pt1 / pt3 / px4 device numbering")
{
	IsdbTuner::TunerType type;
	int tunerNumber;

	IsdbTunerManager::pt1Pt3Px4TunerInfo(0, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbS);
	REQUIRE(tunerNumber == 1);

	IsdbTunerManager::pt1Pt3Px4TunerInfo(1, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbS);
	REQUIRE(tunerNumber == 2);

	IsdbTunerManager::pt1Pt3Px4TunerInfo(2, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbT);
	REQUIRE(tunerNumber == 1);

	IsdbTunerManager::pt1Pt3Px4TunerInfo(3, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbT);
	REQUIRE(tunerNumber == 2);

	IsdbTunerManager::pt1Pt3Px4TunerInfo(5, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbS);
	REQUIRE(tunerNumber == 4);

	IsdbTunerManager::pt1Pt3Px4TunerInfo(6, &type, &tunerNumber);
	REQUIRE(type == IsdbTuner::IsdbT);
	REQUIRE(tunerNumber == 3);
}

TEST_CASE("chardev tuner names")
{
	IsdbTuner::TunerType type;
	QString name;

	REQUIRE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/pt3video3"), &type, &name));
	REQUIRE(type == IsdbTuner::IsdbT);
	REQUIRE(name == QLatin1String("Earthsoft PT3 (Terrestrial) #2"));

	REQUIRE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/pt1video4"), &type, &name));
	REQUIRE(type == IsdbTuner::IsdbS);
	REQUIRE(name == QLatin1String("Earthsoft PT1 / PT2 (Satellite) #3"));

	REQUIRE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/pxmlt8video7"), &type, &name));
	REQUIRE(type == IsdbTuner::IsdbTS);
	REQUIRE(name == QLatin1String("PLEX PX-MLT8PE #8"));

	REQUIRE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/pxs1urvideo0"), &type, &name));
	REQUIRE(type == IsdbTuner::IsdbT);
	REQUIRE(name == QLatin1String("PLEX PX-S1UR #1"));

	REQUIRE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/isdb2056video0"), &type, &name));
	REQUIRE(type == IsdbTuner::IsdbTS);

	REQUIRE_FALSE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/video0"), &type, &name));
	REQUIRE_FALSE(IsdbTunerManager::chardevTunerInfo(QLatin1String("/dev/dvb/adapter0/frontend0"),
		&type, &name));
}

TEST_CASE("device path tables")
{
	QStringList terrestrial = IsdbTunerManager::terrestrialOnlyDevicePaths();
	QStringList satellite = IsdbTunerManager::satelliteOnlyDevicePaths();
	QStringList multi = IsdbTunerManager::multiDevicePaths();

	REQUIRE(terrestrial.contains(QLatin1String("/dev/px4video2")));
	REQUIRE(terrestrial.contains(QLatin1String("/dev/px4video3")));
	REQUIRE_FALSE(terrestrial.contains(QLatin1String("/dev/px4video0")));
	REQUIRE(terrestrial.contains(QLatin1String("/dev/pxs1urvideo0")));
	REQUIRE(satellite.contains(QLatin1String("/dev/px4video0")));
	REQUIRE(satellite.contains(QLatin1String("/dev/pt3video1")));
	REQUIRE_FALSE(satellite.contains(QLatin1String("/dev/pt3video2")));
	REQUIRE(multi.contains(QLatin1String("/dev/pxmlt5video9")));
	REQUIRE(multi.contains(QLatin1String("/dev/pxm1urvideo0")));
}

TEST_CASE("identical tuner names are numbered")
{
	QStringList names;
	names << QLatin1String("MyGica S270 / S880i") << QLatin1String("Digital Devices DD Max M4") <<
		QLatin1String("MyGica S270 / S880i");

	IsdbTunerManager::numberTunerNames(&names);
	REQUIRE(names == (QStringList() << QLatin1String("MyGica S270 / S880i #1") <<
		QLatin1String("Digital Devices DD Max M4 #1") << QLatin1String("MyGica S270 / S880i #2")));
}

TEST_CASE("v4l-dvb tuner names from sysfs")
{
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	QString sysfsPath = dir.path() + QLatin1Char('/');
	REQUIRE(QDir(dir.path()).mkdir(QLatin1String("device")));

	SECTION("usb") {
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/idVendor"), "3275\n"));
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/idProduct"), "0080\n"));
		REQUIRE(IsdbTunerManager::dvbTunerName(sysfsPath, IsdbTuner::IsdbT,
			QLatin1String("Toshiba TC90522")) ==
			QLatin1String("PLEX PX-S1UD / PX-Q1UD / VASTDTV VT20"));
	}

	SECTION("pci") {
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/vendor"), "0x1172\n"));
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/device"), "0x4c15\n"));
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/subsystem_vendor"), "0xee8d\n"));
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/subsystem_device"), "0x0368\n"));
		REQUIRE(IsdbTunerManager::dvbTunerName(sysfsPath, IsdbTuner::IsdbS,
			QLatin1String("Toshiba TC90522")) == QLatin1String("Earthsoft PT3 (Satellite)"));
	}

	SECTION("unknown device") {
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/vendor"), "0x8086\n"));
		REQUIRE(writeFile(sysfsPath + QLatin1String("device/device"), "0x1234\n"));
		REQUIRE(IsdbTunerManager::dvbTunerName(sysfsPath, IsdbTuner::IsdbT,
			QLatin1String("Toshiba TC90522")) == QLatin1String("Toshiba TC90522"));
	}
}

TEST_CASE("tuners are sorted by capability")
{
	FakeProcessFactory factory;
	IsdbTunerManager manager(&factory);
	manager.addTuner(new IsdbTuner(QLatin1String("/dev/pxmlt8video0"), IsdbTuner::ChardevDevice,
		IsdbTuner::IsdbTS, QLatin1String("PLEX PX-MLT8PE #1"), &factory));
	manager.addTuner(new IsdbTuner(QLatin1String("/dev/px4video2"), IsdbTuner::ChardevDevice,
		IsdbTuner::IsdbT, QLatin1String("PLEX PX-W3U4 (Terrestrial) #1"), &factory));
	manager.addTuner(new IsdbTuner(QLatin1String("/dev/px4video0"), IsdbTuner::ChardevDevice,
		IsdbTuner::IsdbS, QLatin1String("PLEX PX-W3U4 (Satellite) #1"), &factory));

	QList<IsdbTuner *> terrestrial = manager.getTerrestrialTuners();
	REQUIRE(terrestrial.size() == 2);
	REQUIRE(terrestrial.at(0)->getDevicePath() == QLatin1String("/dev/px4video2"));
	REQUIRE(terrestrial.at(1)->getDevicePath() == QLatin1String("/dev/pxmlt8video0"));
	REQUIRE(terrestrial.at(1)->supportsSatellite());

	QList<IsdbTuner *> satellite = manager.getSatelliteTuners();
	REQUIRE(satellite.size() == 2);
	REQUIRE(satellite.at(0)->getDevicePath() == QLatin1String("/dev/px4video0"));
	REQUIRE_FALSE(satellite.at(0)->supportsTerrestrial());
	REQUIRE(satellite.at(1)->getDevicePath() == QLatin1String("/dev/pxmlt8video0"));
}
