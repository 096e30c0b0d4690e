/*
 * isdbchannel.h
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

#ifndef ISDBCHANNEL_H
#define ISDBCHANNEL_H

#include <QList>
#include <QMetaType>
#include <QString>

class IsdbServiceInfo
{
public:
	IsdbServiceInfo() : serviceId(-1), serviceType(-1), isFree(true), isOneseg(false),
		channelNumber(QLatin1String("Unknown")), serviceName(QLatin1String("Unknown")) { }
	~IsdbServiceInfo() { }

	QString toString() const;

	int serviceId;
	int serviceType; // -1 until a service descriptor has been seen
	bool isFree;
	bool isOneseg;
	QString channelNumber; // three digits
	QString serviceName;
};

class IsdbTransportStreamInfo
{
public:
	enum BroadcastType
	{
		Terrestrial,
		Bs,
		Cs1,
		Cs2,
		UnknownBroadcast
	};

	IsdbTransportStreamInfo() : transportStreamId(-1), networkId(-1),
		physicalChannel(QLatin1String("Unknown")), networkName(QLatin1String("Unknown")),
		remoteControlKeyId(-1), satelliteFrequency(-1), satelliteTransponder(-1),
		satelliteSlotNumber(-1) { }
	~IsdbTransportStreamInfo() { }

	static BroadcastType broadcastTypeFor(int networkId);
	static QString broadcastTypeName(BroadcastType type);

	BroadcastType broadcastType() const
	{
		return broadcastTypeFor(networkId);
	}

	bool isTerrestrial() const
	{
		return (broadcastType() == Terrestrial);
	}

	bool hasRemoteControlKeyId() const
	{
		return (remoteControlKeyId >= 0);
	}

	bool hasSatelliteFrequency() const
	{
		return (satelliteFrequency >= 0);
	}

	bool hasSatelliteTransponder() const
	{
		return (satelliteTransponder >= 0);
	}

	bool hasSatelliteSlotNumber() const
	{
		return (satelliteSlotNumber >= 0);
	}

	/*
	 * returns the service with the given id, appending a new one if necessary;
	 * the pointer stays valid until the service list is modified again
	 */
	IsdbServiceInfo *findOrInsertService(int serviceId, bool *inserted = NULL);

	void sortServices();

	QString toString() const;

	int transportStreamId;
	int networkId;
	QString physicalChannel; // "T13", "BS01/TS0" or "ND02"
	QString networkName;

	// optional fields; negative means not present
	int remoteControlKeyId; // terrestrial only
	double satelliteFrequency; // GHz
	int satelliteTransponder;
	int satelliteSlotNumber; // BS only

	QList<IsdbServiceInfo> services; // ordered by service id
};

class IsdbScanResult
{
public:
	IsdbScanResult() { }
	~IsdbScanResult() { }

	bool isEmpty() const
	{
		return terrestrial.isEmpty() && bs.isEmpty() && cs.isEmpty();
	}

	// drops pay tv services; cs is left without any service
	void excludePayTv();

	// ordered by physical channel
	QList<IsdbTransportStreamInfo> terrestrial;
	QList<IsdbTransportStreamInfo> bs;
	QList<IsdbTransportStreamInfo> cs;
};

bool operator<(const IsdbServiceInfo &x, const IsdbServiceInfo &y);

Q_DECLARE_METATYPE(IsdbTransportStreamInfo)

#endif /* ISDBCHANNEL_H */
