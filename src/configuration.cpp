/*
 * configuration.cpp
 *
 * Copyright (C) 2011 Christoph Pfister <christophpfister@gmail.com>
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

#include "log.h"

#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>

#include "configuration.h"

Configuration::Configuration()
{
	KConfigGroup group = KSharedConfig::openConfig()->group("Scan");

	recisdbPath = group.readEntry("RecisdbPath", QString(QLatin1String("recisdb")));

	if (recisdbPath.isEmpty()) {
		qCWarning(logConfig, "Empty recisdb path, using the default");
		recisdbPath = QLatin1String("recisdb");
	}

	tuneTimeout = 7.0;
	double timeout = group.readEntry("TuneTimeout", tuneTimeout);

	if (timeout > 0) {
		tuneTimeout = timeout;
	} else {
		qCWarning(logConfig, "Invalid tune timeout %f", timeout);
	}

	terrestrialRecordingTime = 4;
	int value = group.readEntry("TerrestrialRecordingTime", terrestrialRecordingTime);

	if (value > 0) {
		terrestrialRecordingTime = value;
	} else {
		qCWarning(logConfig, "Invalid terrestrial recording time %d", value);
	}

	satelliteRecordingTime = 20;
	value = group.readEntry("SatelliteRecordingTime", satelliteRecordingTime);

	if (value > 0) {
		satelliteRecordingTime = value;
	} else {
		qCWarning(logConfig, "Invalid satellite recording time %d", value);
	}

	minimumOutputSize = 100 * 1024;
	value = group.readEntry("MinimumOutputSize", minimumOutputSize);

	if (value >= 0) {
		minimumOutputSize = value;
	} else {
		qCWarning(logConfig, "Invalid minimum output size %d", value);
	}

	firstTerrestrialChannel = 13;
	lastTerrestrialChannel = 62;
	int first = group.readEntry("FirstTerrestrialChannel", firstTerrestrialChannel);
	int last = group.readEntry("LastTerrestrialChannel", lastTerrestrialChannel);

	if ((first >= 13) && (first <= last) && (last <= 62)) {
		firstTerrestrialChannel = first;
		lastTerrestrialChannel = last;
	} else {
		qCWarning(logConfig, "Invalid terrestrial channel range %d - %d", first, last);
	}
}

Configuration::~Configuration()
{
}

void Configuration::detach()
{
	if (globalInstance) {
		delete globalInstance;
		globalInstance = NULL;
	}
}

Configuration *Configuration::instance()
{
	if (globalInstance == NULL) {
		globalInstance = new Configuration();
	}

	return globalInstance;
}

void Configuration::setRecisdbPath(const QString &newRecisdbPath)
{
	if (newRecisdbPath.isEmpty()) {
		qCWarning(logConfig, "Empty recisdb path");
		return;
	}

	recisdbPath = newRecisdbPath;
	KSharedConfig::openConfig()->group("Scan").writeEntry("RecisdbPath", recisdbPath);
}

void Configuration::setTuneTimeout(double newTuneTimeout)
{
	if (newTuneTimeout > 0) {
		tuneTimeout = newTuneTimeout;
		KSharedConfig::openConfig()->group("Scan").writeEntry("TuneTimeout", tuneTimeout);
	} else {
		qCWarning(logConfig, "Invalid tune timeout %f", newTuneTimeout);
	}
}

void Configuration::setTerrestrialRecordingTime(int newTerrestrialRecordingTime)
{
	if (newTerrestrialRecordingTime > 0) {
		terrestrialRecordingTime = newTerrestrialRecordingTime;
		KSharedConfig::openConfig()->group("Scan").writeEntry("TerrestrialRecordingTime",
			terrestrialRecordingTime);
	} else {
		qCWarning(logConfig, "Invalid terrestrial recording time %d", newTerrestrialRecordingTime);
	}
}

void Configuration::setSatelliteRecordingTime(int newSatelliteRecordingTime)
{
	if (newSatelliteRecordingTime > 0) {
		satelliteRecordingTime = newSatelliteRecordingTime;
		KSharedConfig::openConfig()->group("Scan").writeEntry("SatelliteRecordingTime",
			satelliteRecordingTime);
	} else {
		qCWarning(logConfig, "Invalid satellite recording time %d", newSatelliteRecordingTime);
	}
}

void Configuration::setMinimumOutputSize(int newMinimumOutputSize)
{
	if (newMinimumOutputSize >= 0) {
		minimumOutputSize = newMinimumOutputSize;
		KSharedConfig::openConfig()->group("Scan").writeEntry("MinimumOutputSize", minimumOutputSize);
	} else {
		qCWarning(logConfig, "Invalid minimum output size %d", newMinimumOutputSize);
	}
}

void Configuration::setTerrestrialChannelRange(int first, int last)
{
	if ((first >= 13) && (first <= last) && (last <= 62)) {
		firstTerrestrialChannel = first;
		lastTerrestrialChannel = last;
		KConfigGroup group = KSharedConfig::openConfig()->group("Scan");
		group.writeEntry("FirstTerrestrialChannel", firstTerrestrialChannel);
		group.writeEntry("LastTerrestrialChannel", lastTerrestrialChannel);
	} else {
		qCWarning(logConfig, "Invalid terrestrial channel range %d - %d", first, last);
	}
}

Configuration *Configuration::globalInstance = NULL;
