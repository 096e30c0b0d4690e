/*
 * isdbanalyzer.cpp
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

#include "../log.h"

#include <QMap>
#include <algorithm>

#include "isdbanalyzer.h"
#include "isdbsi.h"

IsdbTransportStreamInfo *IsdbTransportStreamMap::find(int transportStreamId)
{
	for (int i = 0; i < transportStreams.size(); ++i) {
		if (transportStreams.at(i).transportStreamId == transportStreamId) {
			return &transportStreams[i];
		}
	}

	return NULL;
}

IsdbTransportStreamInfo *IsdbTransportStreamMap::findOrInsert(int transportStreamId, bool *inserted)
{
	IsdbTransportStreamInfo *transportStream = find(transportStreamId);

	if (inserted != NULL) {
		*inserted = (transportStream == NULL);
	}

	if (transportStream == NULL) {
		IsdbTransportStreamInfo newTransportStream;
		newTransportStream.transportStreamId = transportStreamId;
		transportStreams.append(newTransportStream);
		transportStream = &transportStreams.last();
	}

	return transportStream;
}

static bool isValidId(int id)
{
	return (id >= 0) && (id <= 0xffff);
}

static bool lessThanSlot(const IsdbTransportStreamInfo *x, const IsdbTransportStreamInfo *y)
{
	return (x->satelliteSlotNumber < y->satelliteSlotNumber);
}

static bool lessThanPhysicalChannel(const IsdbTransportStreamInfo &x,
	const IsdbTransportStreamInfo &y)
{
	return (x.physicalChannel < y.physicalChannel);
}

QString IsdbTransportStreamAnalyzer::bsPhysicalChannel(int transponder, int slot)
{
	return QString(QLatin1String("BS%1/TS%2")).arg(transponder, 2, 10, QLatin1Char('0')).arg(slot);
}

QString IsdbTransportStreamAnalyzer::csPhysicalChannel(int transponder)
{
	return QString(QLatin1String("ND%1")).arg(transponder, 2, 10, QLatin1Char('0'));
}

QString IsdbTransportStreamAnalyzer::terrestrialChannelNumber(int serviceId, int remoteControlKeyId)
{
	int category = ((serviceId >> 7) & 0x3);
	int index = (serviceId & 0x7);
	int number = (category * 200) + (remoteControlKeyId * 10) + (index + 1);
	return QString(QLatin1String("%1")).arg(number, 3, 10, QLatin1Char('0'));
}

bool IsdbTransportStreamAnalyzer::analyze(const IsdbSiRecords &records,
	const QString &tunedPhysicalChannel, QList<IsdbTransportStreamInfo> *result,
	QString *errorString)
{
	IsdbTransportStreamMap map;

	// all transport streams must exist before services can be attached
	foreach (const IsdbNitRecord &record, records.nitRecords) {
		if (!processNit(record, &map, errorString)) {
			return false;
		}
	}

	renumberBsSlots(&map);

	if (tunedPhysicalChannel.startsWith(QLatin1Char('T'))) {
		// terrestrial SI carries no reference to the physical channel
		if (map.size() != 1) {
			*errorString = i18n("Expected exactly one transport stream on %1, found %2.",
				tunedPhysicalChannel, map.size());
			return false;
		}

		map.list()[0].physicalChannel = tunedPhysicalChannel;
	} else {
		std::stable_sort(map.list().begin(), map.list().end(), lessThanPhysicalChannel);
	}

	foreach (const IsdbSdtRecord &record, records.sdtRecords) {
		if (!processSdt(record, &map, errorString)) {
			return false;
		}
	}

	for (int i = 0; i < map.list().size(); ++i) {
		assignChannelNumbers(&map.list()[i]);
	}

	qCDebug(logScan, "Analyzed %d transport streams on %s", map.size(),
		qPrintable(tunedPhysicalChannel));
	result->append(map.list());
	return true;
}

bool IsdbTransportStreamAnalyzer::processNit(const IsdbNitRecord &record,
	IsdbTransportStreamMap *map, QString *errorString)
{
	if (!isValidId(record.networkId)) {
		*errorString = i18n("Invalid network id %1 in NIT.", record.networkId);
		return false;
	}

	foreach (const IsdbNitEntry &entry, record.transportStreams) {
		if (!isValidId(entry.transportStreamId)) {
			*errorString = i18n("Invalid transport stream id %1 in NIT.",
				entry.transportStreamId);
			return false;
		}

		IsdbTransportStreamInfo *transportStream = map->findOrInsert(entry.transportStreamId);
		transportStream->networkId = record.networkId;

		int tsid = transportStream->transportStreamId;

		switch (transportStream->broadcastType()) {
		case IsdbTransportStreamInfo::Bs:
			// network id (4) | flag (3) | transponder (5) | reserved (1) | slot (3)
			transportStream->satelliteTransponder = ((tsid >> 4) & 0x1f);
			transportStream->satelliteSlotNumber = (tsid & 0x7);
			transportStream->physicalChannel = bsPhysicalChannel(
				transportStream->satelliteTransponder,
				transportStream->satelliteSlotNumber);
			break;
		case IsdbTransportStreamInfo::Cs1:
		case IsdbTransportStreamInfo::Cs2:
			transportStream->satelliteTransponder = ((tsid >> 4) & 0x1f);
			transportStream->physicalChannel =
				csPhysicalChannel(transportStream->satelliteTransponder);
			break;
		case IsdbTransportStreamInfo::Terrestrial:
			break;
		case IsdbTransportStreamInfo::UnknownBroadcast:
			qCWarning(logScan, "Unknown network id 0x%04x for transport stream 0x%04x",
				record.networkId, tsid);
			break;
		}

		if (transportStream->isTerrestrial()) {
			QList<IsdbDescriptor> descriptors =
				entry.descriptors.list(IsdbDescriptorBase::TsInformation);

			if (!descriptors.isEmpty()) {
				const IsdbTsInformationDescriptor *tsInformation =
					descriptors.first().as<IsdbTsInformationDescriptor>();
				transportStream->networkName = IsdbSiText::normalize(tsInformation->tsName);
				transportStream->remoteControlKeyId = tsInformation->remoteControlKeyId;
			}

			descriptors = entry.descriptors.list(IsdbDescriptorBase::PartialReception);

			if (!descriptors.isEmpty()) {
				const IsdbPartialReceptionDescriptor *partialReception =
					descriptors.first().as<IsdbPartialReceptionDescriptor>();

				foreach (int serviceId, partialReception->serviceIds) {
					if (!isValidId(serviceId)) {
						*errorString = i18n("Invalid service id %1 in partial reception descriptor.",
							serviceId);
						return false;
					}

					transportStream->findOrInsertService(serviceId)->isOneseg = true;
				}
			}
		} else {
			foreach (const IsdbDescriptor &descriptor,
				 entry.descriptors.list(IsdbDescriptorBase::SatelliteDeliverySystem)) {
				transportStream->satelliteFrequency =
					descriptor.as<IsdbSatelliteDeliverySystemDescriptor>()->frequency;
			}

			// on terrestrial networks this is a region name like "関東広域0"
			QList<IsdbDescriptor> descriptors =
				record.networkDescriptors.list(IsdbDescriptorBase::NetworkName);

			if (!descriptors.isEmpty()) {
				transportStream->networkName = IsdbSiText::normalize(
					descriptors.first().as<IsdbNetworkNameDescriptor>()->networkName);
			}
		}
	}

	return true;
}

void IsdbTransportStreamAnalyzer::renumberBsSlots(IsdbTransportStreamMap *map)
{
	/*
	 * after band reorganisations slots may have gaps (or no slot 0), but tuners
	 * expect relative ts numbers counting densely from 0
	 */
	QMap<int, QList<IsdbTransportStreamInfo *> > groups;

	for (int i = 0; i < map->list().size(); ++i) {
		IsdbTransportStreamInfo *transportStream = &map->list()[i];

		if ((transportStream->broadcastType() == IsdbTransportStreamInfo::Bs) &&
		    transportStream->hasSatelliteTransponder()) {
			groups[transportStream->satelliteTransponder].append(transportStream);
		}
	}

	for (QMap<int, QList<IsdbTransportStreamInfo *> >::iterator it = groups.begin();
	     it != groups.end(); ++it) {
		QList<IsdbTransportStreamInfo *> &group = it.value();
		std::stable_sort(group.begin(), group.end(), lessThanSlot);

		for (int slot = 0; slot < group.size(); ++slot) {
			IsdbTransportStreamInfo *transportStream = group.at(slot);

			if (transportStream->satelliteSlotNumber != slot) {
				qCDebug(logScan, "Renumbering %s to slot %d",
					qPrintable(transportStream->physicalChannel), slot);
			}

			transportStream->satelliteSlotNumber = slot;
			transportStream->physicalChannel =
				bsPhysicalChannel(transportStream->satelliteTransponder, slot);
		}
	}
}

bool IsdbTransportStreamAnalyzer::processSdt(const IsdbSdtRecord &record,
	IsdbTransportStreamMap *map, QString *errorString)
{
	IsdbTransportStreamInfo *transportStream = map->find(record.transportStreamId);

	if (transportStream == NULL) {
		// not announced by the NIT
		return true;
	}

	foreach (const IsdbSdtEntry &entry, record.services) {
		if (!isValidId(entry.serviceId)) {
			*errorString = i18n("Invalid service id %1 in SDT.", entry.serviceId);
			return false;
		}

		IsdbServiceInfo *service = transportStream->findOrInsertService(entry.serviceId);
		service->isFree = !entry.freeCaMode;

		QList<IsdbDescriptor> descriptors = entry.descriptors.list(IsdbDescriptorBase::Service);

		if (!descriptors.isEmpty()) {
			const IsdbServiceDescriptor *serviceDescriptor =
				descriptors.first().as<IsdbServiceDescriptor>();
			service->serviceType = serviceDescriptor->serviceType;
			service->serviceName = IsdbSiText::normalize(serviceDescriptor->serviceName);
		}
	}

	transportStream->sortServices();
	return true;
}

void IsdbTransportStreamAnalyzer::assignChannelNumbers(IsdbTransportStreamInfo *transportStream)
{
	bool terrestrial = transportStream->isTerrestrial();
	int remoteControlKeyId = transportStream->remoteControlKeyId;

	if (terrestrial && !transportStream->hasRemoteControlKeyId()) {
		qCWarning(logScan, "No remote control key id for transport stream 0x%04x",
			transportStream->transportStreamId);
		remoteControlKeyId = 0;
	}

	// one-seg services may only be known from the NIT
	transportStream->sortServices();

	for (int i = 0; i < transportStream->services.size(); ++i) {
		IsdbServiceInfo &service = transportStream->services[i];

		if (terrestrial) {
			service.channelNumber =
				terrestrialChannelNumber(service.serviceId, remoteControlKeyId);
		} else {
			service.channelNumber = QString(QLatin1String("%1"))
				.arg(service.serviceId, 3, 10, QLatin1Char('0'));
		}
	}
}
