/*
 * isdbjsonwriter.cpp
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

#include <QFile>
#include <QJsonDocument>

#include "isdbjsonwriter.h"

QJsonObject IsdbJsonWriter::serviceObject(const IsdbServiceInfo &service)
{
	QJsonObject object;
	object.insert(QLatin1String("service_id"), service.serviceId);
	object.insert(QLatin1String("service_name"), service.serviceName);
	object.insert(QLatin1String("service_type"), service.serviceType);
	object.insert(QLatin1String("channel_number"), service.channelNumber);
	object.insert(QLatin1String("is_free"), service.isFree);
	object.insert(QLatin1String("is_oneseg"), service.isOneseg);
	return object;
}

QJsonObject IsdbJsonWriter::transportStreamObject(const IsdbTransportStreamInfo &transportStream)
{
	QJsonObject object;
	object.insert(QLatin1String("physical_channel"), transportStream.physicalChannel);
	object.insert(QLatin1String("transport_stream_id"), transportStream.transportStreamId);
	object.insert(QLatin1String("network_id"), transportStream.networkId);
	object.insert(QLatin1String("network_name"), transportStream.networkName);

	if (transportStream.hasRemoteControlKeyId()) {
		object.insert(QLatin1String("remote_control_key_id"),
			transportStream.remoteControlKeyId);
	} else {
		object.insert(QLatin1String("remote_control_key_id"), QJsonValue());
	}

	if (transportStream.hasSatelliteFrequency()) {
		object.insert(QLatin1String("satellite_frequency"), transportStream.satelliteFrequency);
	} else {
		object.insert(QLatin1String("satellite_frequency"), QJsonValue());
	}

	if (transportStream.hasSatelliteTransponder()) {
		object.insert(QLatin1String("satellite_transponder"),
			transportStream.satelliteTransponder);
	} else {
		object.insert(QLatin1String("satellite_transponder"), QJsonValue());
	}

	if (transportStream.hasSatelliteSlotNumber()) {
		object.insert(QLatin1String("satellite_slot_number"),
			transportStream.satelliteSlotNumber);
	} else {
		object.insert(QLatin1String("satellite_slot_number"), QJsonValue());
	}

	QJsonArray services;

	foreach (const IsdbServiceInfo &service, transportStream.services) {
		services.append(serviceObject(service));
	}

	object.insert(QLatin1String("services"), services);
	return object;
}

QJsonArray IsdbJsonWriter::transportStreamArray(
	const QList<IsdbTransportStreamInfo> &transportStreams)
{
	QJsonArray array;

	foreach (const IsdbTransportStreamInfo &transportStream, transportStreams) {
		array.append(transportStreamObject(transportStream));
	}

	return array;
}

QByteArray IsdbJsonWriter::toJson(const IsdbScanResult &result)
{
	QJsonObject root;
	root.insert(QLatin1String("Terrestrial"), transportStreamArray(result.terrestrial));
	root.insert(QLatin1String("BS"), transportStreamArray(result.bs));
	root.insert(QLatin1String("CS"), transportStreamArray(result.cs));
	return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool IsdbJsonWriter::write(const IsdbScanResult &result, const QString &fileName,
	QString *errorString)
{
	QFile file(fileName);

	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		*errorString = i18n("Cannot open file %1.", fileName);
		qCWarning(logScan, "Cannot open file %s", qPrintable(file.fileName()));
		return false;
	}

	QByteArray data = toJson(result);

	if (file.write(data) != data.size()) {
		*errorString = i18n("Cannot write file %1.", fileName);
		qCWarning(logScan, "Cannot write file %s: %s", qPrintable(file.fileName()),
			qPrintable(file.errorString()));
		return false;
	}

	file.close();
	qCDebug(logScan, "Wrote %d bytes to %s", data.size(), qPrintable(file.fileName()));
	return true;
}
