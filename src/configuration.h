/*
 * configuration.h
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

#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include <QString>

class Configuration
{
private:
	Configuration();
	~Configuration();

public:
	static Configuration *instance();
	static void detach();

	QString getRecisdbPath() const
	{
		return recisdbPath;
	}

	void setRecisdbPath(const QString &newRecisdbPath);

	// seconds without any data before tuning is considered failed
	double getTuneTimeout() const
	{
		return tuneTimeout;
	}

	void setTuneTimeout(double newTuneTimeout);

	int getTerrestrialRecordingTime() const
	{
		return terrestrialRecordingTime;
	}

	void setTerrestrialRecordingTime(int newTerrestrialRecordingTime);

	int getSatelliteRecordingTime() const
	{
		return satelliteRecordingTime;
	}

	void setSatelliteRecordingTime(int newSatelliteRecordingTime);

	// a successful capture always yields more than this many bytes
	int getMinimumOutputSize() const
	{
		return minimumOutputSize;
	}

	void setMinimumOutputSize(int newMinimumOutputSize);

	int getFirstTerrestrialChannel() const
	{
		return firstTerrestrialChannel;
	}

	int getLastTerrestrialChannel() const
	{
		return lastTerrestrialChannel;
	}

	void setTerrestrialChannelRange(int first, int last);

private:
	static Configuration *globalInstance;

	QString recisdbPath;
	double tuneTimeout;
	int terrestrialRecordingTime;
	int satelliteRecordingTime;
	int minimumOutputSize;
	int firstTerrestrialChannel;
	int lastTerrestrialChannel;
};

#endif /* CONFIGURATION_H */
