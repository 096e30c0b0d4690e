/*
 * test_siparser.cpp
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

#include "isdb/isdbanalyzer.h"
#include "isdb/isdbsiparser.h"

static QByteArray descriptor(int tag, const QByteArray &payload)
{
	QByteArray data;
	data.append(char(tag));
	data.append(char(payload.size()));
	data.append(payload);
	return data;
}

// LS1 switches to the alphanumeric set
static QByteArray aribText(const char *text)
{
	return QByteArray("\x0e") + QByteArray(text);
}

static void appendUint16(QByteArray *data, int value)
{
	data->append(char(value >> 8));
	data->append(char(value & 0xff));
}

static QByteArray finishSection(int tableId, int tableIdExtension, int version,
	const QByteArray &body)
{
	QByteArray section;
	section.append(char(tableId));
	appendUint16(&section, 0xf000 | (5 + body.size() + 4));
	appendUint16(&section, tableIdExtension);
	section.append(char(0xc1 | (version << 1)));
	section.append(char(0x00)); // section number
	section.append(char(0x00)); // last section number
	section.append(body);

	unsigned int crc32 = IsdbSiParser::verifyCrc32(section.constData(), section.size());
	section.append(char(crc32 >> 24));
	section.append(char((crc32 >> 16) & 0xff));
	section.append(char((crc32 >> 8) & 0xff));
	section.append(char(crc32 & 0xff));
	return section;
}

static QByteArray transportStreamEntry(int transportStreamId, int networkId,
	const QByteArray &descriptors)
{
	QByteArray entry;
	appendUint16(&entry, transportStreamId);
	appendUint16(&entry, networkId);
	appendUint16(&entry, 0xf000 | descriptors.size());
	entry.append(descriptors);
	return entry;
}

static QByteArray nitSection(int tableId, int networkId, const QByteArray &networkDescriptors,
	const QByteArray &transportStreamLoop, int version = 0)
{
	QByteArray body;
	appendUint16(&body, 0xf000 | networkDescriptors.size());
	body.append(networkDescriptors);
	appendUint16(&body, 0xf000 | transportStreamLoop.size());
	body.append(transportStreamLoop);
	return finishSection(tableId, networkId, version, body);
}

static QByteArray nitSection(int tableId, int networkId, const QByteArray &networkDescriptors,
	int transportStreamId, const QByteArray &transportStreamDescriptors, int version = 0)
{
	return nitSection(tableId, networkId, networkDescriptors,
		transportStreamEntry(transportStreamId, networkId, transportStreamDescriptors), version);
}

static QByteArray sdtSection(int transportStreamId, int networkId, int serviceId,
	bool freeCaMode, const QByteArray &serviceDescriptors, int tableId = 0x42)
{
	QByteArray body;
	appendUint16(&body, networkId);
	body.append(char(0xff));
	appendUint16(&body, serviceId);
	body.append(char(0xfc));
	appendUint16(&body, 0x8000 | (freeCaMode ? 0x1000 : 0) | serviceDescriptors.size());
	body.append(serviceDescriptors);
	return finishSection(tableId, transportStreamId, 0, body);
}

// splits a section into transport stream packets
static QByteArray packetize(int pid, const QByteArray &section, int *continuityCounter)
{
	QByteArray packets;
	int position = 0;

	while (position < section.size()) {
		QByteArray packet;
		bool first = (position == 0);
		packet.append(char(0x47));
		packet.append(char((first ? 0x40 : 0x00) | (pid >> 8)));
		packet.append(char(pid & 0xff));
		packet.append(char(0x10 | (*continuityCounter & 0x0f)));
		++*continuityCounter;

		if (first) {
			packet.append(char(0x00)); // pointer field
		}

		QByteArray payload = section.mid(position, 188 - packet.size());
		packet.append(payload);
		position += payload.size();
		packet.append(QByteArray(188 - packet.size(), char(0xff)));
		packets.append(packet);
	}

	return packets;
}

static QByteArray terrestrialNit(int version = 0)
{
	QByteArray tsInformation;
	tsInformation.append(char(0x05));
	QByteArray tsName = aribText("TOKYO MX");
	tsInformation.append(char(tsName.size() << 2));
	tsInformation.append(tsName);

	QByteArray partialReception;
	appendUint16(&partialReception, 0x5d88);

	QByteArray descriptors = descriptor(0xcd, tsInformation) + descriptor(0xfb, partialReception);
	return nitSection(0x40, 0x7fe8, descriptor(0x40, aribText("KANTO")), 0x7fe8, descriptors,
		version);
}

static QByteArray serviceDescriptor(int serviceType, const char *providerName,
	const char *serviceName)
{
	QByteArray service;
	service.append(char(serviceType));
	QByteArray provider = aribText(providerName);
	service.append(char(provider.size()));
	service.append(provider);
	QByteArray name = aribText(serviceName);
	service.append(char(name.size()));
	service.append(name);
	return descriptor(0x48, service);
}

static QByteArray terrestrialSdt()
{
	return sdtSection(0x7fe8, 0x7fe8, 0x5c38, false, serviceDescriptor(0x01, "MX", "TOKYO MX1"));
}

TEST_CASE("crc32")
{
	QByteArray section = terrestrialSdt();
	REQUIRE(IsdbSiParser::verifyCrc32(section.constData(), section.size()) == 0);

	section[12] = char(section.at(12) ^ 0x01);
	REQUIRE(IsdbSiParser::verifyCrc32(section.constData(), section.size()) != 0);
}

TEST_CASE("terrestrial si from transport stream packets")
{
	int nitContinuity = 0;
	int sdtContinuity = 0;
	QByteArray stream = packetize(0x10, terrestrialNit(), &nitContinuity) +
		packetize(0x11, terrestrialSdt(), &sdtContinuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);

	REQUIRE(records.nitRecords.size() == 1);
	REQUIRE(records.sdtRecords.size() == 1);

	const IsdbNitRecord &nit = records.nitRecords.at(0);
	REQUIRE(nit.networkId == 0x7fe8);
	REQUIRE(nit.transportStreams.size() == 1);
	REQUIRE(nit.transportStreams.at(0).transportStreamId == 0x7fe8);

	QList<IsdbDescriptor> descriptors =
		nit.transportStreams.at(0).descriptors.list(IsdbDescriptorBase::TsInformation);
	REQUIRE(descriptors.size() == 1);
	REQUIRE(descriptors.at(0).as<IsdbTsInformationDescriptor>()->remoteControlKeyId == 5);
	REQUIRE(descriptors.at(0).as<IsdbTsInformationDescriptor>()->tsName == QLatin1String("TOKYO MX"));

	descriptors = nit.transportStreams.at(0).descriptors.list(IsdbDescriptorBase::PartialReception);
	REQUIRE(descriptors.size() == 1);
	REQUIRE(descriptors.at(0).as<IsdbPartialReceptionDescriptor>()->serviceIds == (QList<int>() << 0x5d88));

	const IsdbSdtRecord &sdt = records.sdtRecords.at(0);
	REQUIRE(sdt.transportStreamId == 0x7fe8);
	REQUIRE(sdt.services.size() == 1);
	REQUIRE(sdt.services.at(0).serviceId == 0x5c38);
	REQUIRE_FALSE(sdt.services.at(0).freeCaMode);

	descriptors = sdt.services.at(0).descriptors.list(IsdbDescriptorBase::Service);
	REQUIRE(descriptors.size() == 1);
	REQUIRE(descriptors.at(0).as<IsdbServiceDescriptor>()->serviceType == 0x01);
	REQUIRE(descriptors.at(0).as<IsdbServiceDescriptor>()->serviceName == QLatin1String("TOKYO MX1"));

	QList<IsdbTransportStreamInfo> result;
	QString errorString;
	REQUIRE(IsdbTransportStreamAnalyzer::analyze(records, QLatin1String("T16"), &result,
		&errorString));
	REQUIRE(result.size() == 1);
	REQUIRE(result.at(0).networkName == QLatin1String("TOKYO MX"));
	REQUIRE(result.at(0).services.size() == 2);
	REQUIRE(result.at(0).services.at(0).channelNumber == QLatin1String("051"));
	REQUIRE(result.at(0).services.at(1).isOneseg);
}

TEST_CASE("sections spanning several packets")
{
	QByteArray longName(200, 'A');
	QByteArray tsInformation;
	tsInformation.append(char(0x01));
	tsInformation.append(char(0x00));
	QByteArray descriptors = descriptor(0xcd, tsInformation);

	// network name descriptors are limited to 255 bytes each
	QByteArray networkDescriptors = descriptor(0x40, aribText(longName.constData())) +
		descriptor(0x40, aribText("SECOND"));

	QByteArray section = nitSection(0x40, 0x7fe8, networkDescriptors, 0x7fe8, descriptors);
	REQUIRE(section.size() > 188);

	int continuity = 0;
	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(packetize(0x10, section, &continuity));

	REQUIRE(records.nitRecords.size() == 1);
	QList<IsdbDescriptor> names = records.nitRecords.at(0).networkDescriptors.list(
		IsdbDescriptorBase::NetworkName);
	REQUIRE(names.size() == 2);
	REQUIRE(names.at(0).as<IsdbNetworkNameDescriptor>()->networkName == QString::fromLatin1(longName));
	REQUIRE(names.at(1).as<IsdbNetworkNameDescriptor>()->networkName == QLatin1String("SECOND"));
}

TEST_CASE("satellite delivery system descriptor")
{
	QByteArray payload("\x01\x17\x27\x48\x11\x00\x81\x02\x88\x60\x01", 11);
	IsdbDescriptorMap descriptors;
	QByteArray data = descriptor(0x43, payload);
	IsdbSiParser::parseDescriptors(reinterpret_cast<const unsigned char *>(data.constData()),
		data.size(), &descriptors);

	QList<IsdbDescriptor> list = descriptors.list(IsdbDescriptorBase::SatelliteDeliverySystem);
	REQUIRE(list.size() == 1);

	const IsdbSatelliteDeliverySystemDescriptor *deliverySystem =
		list.at(0).as<IsdbSatelliteDeliverySystemDescriptor>();
	REQUIRE(deliverySystem->frequency == Approx(11.72748));
	REQUIRE(deliverySystem->orbitalPosition == 1100);
	REQUIRE(deliverySystem->westEastFlag);
	REQUIRE(deliverySystem->symbolRate == 28860);
}

TEST_CASE("truncated descriptors are ignored")
{
	QByteArray data("\x48\x10\x01\x00", 4);
	IsdbDescriptorMap descriptors;
	IsdbSiParser::parseDescriptors(reinterpret_cast<const unsigned char *>(data.constData()),
		data.size(), &descriptors);
	REQUIRE(descriptors.isEmpty());
}

TEST_CASE("sections with a wrong crc are dropped")
{
	QByteArray section = terrestrialSdt();
	section[section.size() - 1] = char(section.at(section.size() - 1) ^ 0xff);

	int continuity = 0;
	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(packetize(0x11, section, &continuity));
	REQUIRE(records.sdtRecords.isEmpty());
}

TEST_CASE("repeated sections are decoded once")
{
	int continuity = 0;
	QByteArray stream;

	for (int i = 0; i < 3; ++i) {
		stream += packetize(0x10, terrestrialNit(), &continuity);
	}

	// a new version is a different section
	stream += packetize(0x10, terrestrialNit(1), &continuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);
	REQUIRE(records.nitRecords.size() == 2);
}

TEST_CASE("other tables on the si pids are ignored")
{
	int nitContinuity = 0;
	int sdtContinuity = 0;

	// nit of another network and a bat
	QByteArray stream = packetize(0x10, nitSection(0x41, 0x0004, QByteArray(), 0x4010, QByteArray()),
		&nitContinuity);
	stream += packetize(0x11, finishSection(0x4a, 0x0001, 0, QByteArray("\xf0\x00\xf0\x00", 4)),
		&sdtContinuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);
	REQUIRE(records.nitRecords.isEmpty());
	REQUIRE(records.sdtRecords.isEmpty());
}

TEST_CASE("sdt of other transport streams is decoded")
{
	int sdtContinuity = 0;
	QByteArray stream = packetize(0x11, sdtSection(0x4011, 0x0004, 103, false,
		serviceDescriptor(0x01, "NHK", "NHK BSP"), 0x46), &sdtContinuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);
	REQUIRE(records.sdtRecords.size() == 1);
	REQUIRE(records.sdtRecords.at(0).transportStreamId == 0x4011);
	REQUIRE(records.sdtRecords.at(0).services.size() == 1);
	REQUIRE(records.sdtRecords.at(0).services.at(0).serviceId == 103);
}

TEST_CASE("bs services of every transport stream from one capture")
{
	int nitContinuity = 0;
	int sdtContinuity = 0;

	// the tuned stream 0x4010 and its neighbour 0x4011 on the same transponder
	QByteArray transportStreams = transportStreamEntry(0x4010, 0x0004, QByteArray()) +
		transportStreamEntry(0x4011, 0x0004, QByteArray());
	QByteArray stream = packetize(0x10, nitSection(0x40, 0x0004,
		descriptor(0x40, aribText("BS Digital")), transportStreams), &nitContinuity);
	stream += packetize(0x11, sdtSection(0x4010, 0x0004, 101, false,
		serviceDescriptor(0x01, "NHK", "NHK BS1")), &sdtContinuity);
	stream += packetize(0x11, sdtSection(0x4011, 0x0004, 103, false,
		serviceDescriptor(0x01, "NHK", "NHK BSP"), 0x46), &sdtContinuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);
	REQUIRE(records.nitRecords.size() == 1);
	REQUIRE(records.sdtRecords.size() == 2);

	QList<IsdbTransportStreamInfo> result;
	QString errorString;
	REQUIRE(IsdbTransportStreamAnalyzer::analyze(records, QLatin1String("BS01/TS0"), &result,
		&errorString));
	REQUIRE(result.size() == 2);

	REQUIRE(result.at(0).physicalChannel == QLatin1String("BS01/TS0"));
	REQUIRE(result.at(0).networkName == QLatin1String("BS Digital"));
	REQUIRE(result.at(0).services.size() == 1);
	REQUIRE(result.at(0).services.at(0).serviceName == QLatin1String("NHK BS1"));
	REQUIRE(result.at(0).services.at(0).channelNumber == QLatin1String("101"));

	REQUIRE(result.at(1).physicalChannel == QLatin1String("BS01/TS1"));
	REQUIRE(result.at(1).services.size() == 1);
	REQUIRE(result.at(1).services.at(0).serviceName == QLatin1String("NHK BSP"));
	REQUIRE(result.at(1).services.at(0).channelNumber == QLatin1String("103"));
}

TEST_CASE("packet synchronisation is recovered")
{
	int continuity = 0;
	QByteArray stream = QByteArray("\x00\x01\x02\x03\x04", 5) +
		packetize(0x11, terrestrialSdt(), &continuity);

	IsdbSiParser parser;
	IsdbSiRecords records = parser.decode(stream);
	REQUIRE(records.sdtRecords.size() == 1);
}
