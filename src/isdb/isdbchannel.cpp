/*
 * isdbchannel.cpp
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

#include <algorithm>

#include "isdbchannel.h"

QString IsdbServiceInfo::toString() const
{
	QString message = QString(QLatin1String("Ch: %1 | %2 ")).arg(channelNumber, serviceName);

	if (serviceType == 0x02) {
		message += QLatin1String("[Radio]");
	} else if ((serviceType >= 0xa1) && (serviceType <= 0xa3)) {
		message += QLatin1String("[Temporary]");
	} else if (serviceType == 0xa4) {
		message += QLatin1String("[Engineering Service]");
	} else if ((serviceType >= 0xa5) && (serviceType <= 0xa7)) {
		message += QLatin1String("[Promotion]");
	} else if ((serviceType == 0xc0) && !isOneseg) {
		message += QLatin1String("[Data]");
	}

	if (!isFree) {
		message += QLatin1String("[Pay TV]");
	}

	if (isOneseg) {
		message += QLatin1String("[OneSeg]");
	}

	// trailing blank if no tag was added
	while (message.endsWith(QLatin1Char(' '))) {
		message.chop(1);
	}

	return message;
}

bool operator<(const IsdbServiceInfo &x, const IsdbServiceInfo &y)
{
	return (x.serviceId < y.serviceId);
}

IsdbTransportStreamInfo::BroadcastType IsdbTransportStreamInfo::broadcastTypeFor(int networkId)
{
	if ((networkId >= 0x7880) && (networkId <= 0x7fe8)) {
		return Terrestrial;
	}

	switch (networkId) {
	case 4:
		return Bs;
	case 6:
		return Cs1;
	case 7:
		return Cs2;
	}

	return UnknownBroadcast;
}

QString IsdbTransportStreamInfo::broadcastTypeName(BroadcastType type)
{
	switch (type) {
	case Terrestrial:
		return QLatin1String("Terrestrial");
	case Bs:
		return QLatin1String("BS");
	case Cs1:
		return QLatin1String("CS1");
	case Cs2:
		return QLatin1String("CS2");
	case UnknownBroadcast:
		break;
	}

	return QLatin1String("Unknown");
}

IsdbServiceInfo *IsdbTransportStreamInfo::findOrInsertService(int serviceId, bool *inserted)
{
	for (int i = 0; i < services.size(); ++i) {
		if (services.at(i).serviceId == serviceId) {
			if (inserted != NULL) {
				*inserted = false;
			}

			return &services[i];
		}
	}

	IsdbServiceInfo service;
	service.serviceId = serviceId;
	services.append(service);

	if (inserted != NULL) {
		*inserted = true;
	}

	return &services.last();
}

void IsdbTransportStreamInfo::sortServices()
{
	std::stable_sort(services.begin(), services.end());
}

QString IsdbTransportStreamInfo::toString() const
{
	BroadcastType type = broadcastType();
	QString channel = physicalChannel;
	QString message;

	if (type == Terrestrial) {
		if (channel.startsWith(QLatin1Char('T'))) {
			channel = channel.mid(1);
		}

		channel += QLatin1String("ch");
		message = QString(QLatin1String("%1 - %2 / TSID: %3 | %4: %5"))
			.arg(broadcastTypeName(type), channel).arg(transportStreamId)
			.arg(remoteControlKeyId, 2, 10, QLatin1Char('0')).arg(networkName);
	} else {
		QString frequency = QLatin1String("Unknown");

		if (hasSatelliteFrequency()) {
			frequency = QString::number(satelliteFrequency, 'f', 5);
		}

		message = QString(QLatin1String("%1 - %2 / TSID: %3 / Frequency: %4 GHz | %5"))
			.arg(broadcastTypeName(type), channel).arg(transportStreamId)
			.arg(frequency, networkName);
	}

	return message.trimmed();
}

void IsdbScanResult::excludePayTv()
{
	for (int i = 0; i < terrestrial.size(); ++i) {
		QList<IsdbServiceInfo> &services = terrestrial[i].services;

		for (int j = services.size() - 1; j >= 0; --j) {
			if (!services.at(j).isFree) {
				services.removeAt(j);
			}
		}
	}

	for (int i = 0; i < bs.size(); ++i) {
		QList<IsdbServiceInfo> &services = bs[i].services;

		for (int j = services.size() - 1; j >= 0; --j) {
			if (!services.at(j).isFree) {
				services.removeAt(j);
			}
		}
	}

	// the few free cs services are shopping channels
	for (int i = 0; i < cs.size(); ++i) {
		cs[i].services.clear();
	}
}
