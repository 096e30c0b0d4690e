/*
 * isdbsiparser.cpp
 *
 * Copyright (C) 2007-2011 Christoph Pfister <christophpfister@gmail.com>
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

#include "isdbsiparser.h"

void IsdbSectionAssembler::processData(const char data[188])
{
	if ((data[3] & 0x10) == 0) {
		// no payload
		return;
	}

	unsigned char continuity = (data[3] & 0x0f);

	if (bufferValid) {
		if (continuity == continuityCounter) {
			qCDebug(logIsdbSi, "Section duplication: received %d, expecting %d", continuity,
				(continuityCounter + 1) & 0x0f);
			return;
		}

		if (continuity != ((continuityCounter + 1) & 0x0f)) {
			qCDebug(logIsdbSi, "Section discontinuity: received %d, expecting %d", continuity,
				(continuityCounter + 1) & 0x0f);
			bufferValid = false;
			buffer.clear();
		}
	}

	continuityCounter = continuity;

	bool sectionStart = ((data[1] & 0x40) != 0);
	const char *payload;
	int payloadLength;

	if ((data[3] & 0x20) == 0) {
		// adaptation field not present
		payload = (data + 4);
		payloadLength = (188 - 4);
	} else {
		// adaptation field present
		unsigned char length = data[4];

		if (length > 182) {
			qCDebug(logIsdbSi, "Received a packet without payload or corrupted");
			return;
		}

		payload = (data + 5 + length);
		payloadLength = (188 - 5 - length);
	}

	if (sectionStart) {
		int pointer = quint8(payload[0]);

		if (pointer >= payloadLength) {
			qCDebug(logIsdbSi, "Section with invalid payload pointer");
			pointer = (payloadLength - 1);
		}

		if (bufferValid) {
			buffer.append(payload + 1, pointer);
			processSections(true);
		} else {
			bufferValid = true;
		}

		payload += (pointer + 1);
		payloadLength -= (pointer + 1);
	}

	if (!bufferValid) {
		// waiting for the start of a section
		return;
	}

	buffer.append(payload, payloadLength);
	processSections(false);
}

void IsdbSectionAssembler::processSections(bool force)
{
	const char *it = buffer.constBegin();
	const char *end = buffer.constEnd();

	while (it != end) {
		if (static_cast<unsigned char>(it[0]) == 0xff) {
			// table id == 0xff means padding
			it = end;
			break;
		}

		if ((end - it) < 3) {
			if (force) {
				qCDebug(logIsdbSi, "Section with stray data");
				it = end;
			}

			break;
		}

		const char *sectionEnd = (it + (((static_cast<unsigned char>(it[1]) & 0x0f) << 8) |
			static_cast<unsigned char>(it[2])) + 3);

		if (force && (sectionEnd > end)) {
			qCDebug(logIsdbSi, "Short section");
			it = end;
			break;
		}

		if (sectionEnd <= end) {
			int size = int(sectionEnd - it);

			if (IsdbSiParser::verifyCrc32(it, size) == 0) {
				sections.append(QByteArray(it, size));
			} else {
				qCDebug(logIsdbSi, "Section with wrong crc, table id 0x%02x",
					static_cast<unsigned char>(it[0]));
			}

			it = sectionEnd;
			continue;
		}

		break;
	}

	buffer.remove(0, int(it - buffer.constBegin()));
}

QList<QByteArray> IsdbSectionAssembler::takeSections()
{
	QList<QByteArray> result = sections;
	sections.clear();
	return result;
}

unsigned int IsdbSiParser::verifyCrc32(const char *data, int size)
{
	static unsigned int crc32Table[256];
	static bool tableInitialized = false;

	if (!tableInitialized) {
		// crc-32/mpeg-2, polynomial 0x04c11db7
		for (unsigned int i = 0; i < 256; ++i) {
			unsigned int value = (i << 24);

			for (int j = 0; j < 8; ++j) {
				value = ((value & 0x80000000) != 0) ? ((value << 1) ^ 0x04c11db7) : (value << 1);
			}

			crc32Table[i] = value;
		}

		tableInitialized = true;
	}

	unsigned int crc32 = 0xffffffff;

	for (int i = 0; i < size; ++i) {
		crc32 = (crc32 << 8) ^ crc32Table[(crc32 >> 24) ^ static_cast<unsigned char>(data[i])];
	}

	return crc32;
}

static int bcdValue(const unsigned char *data, int digits)
{
	int value = 0;

	for (int i = 0; i < digits; ++i) {
		int nibble = ((i % 2) == 0) ? (data[i / 2] >> 4) : (data[i / 2] & 0x0f);
		value = (value * 10) + nibble;
	}

	return value;
}

void IsdbSiParser::parseDescriptors(const unsigned char *data, int size,
	IsdbDescriptorMap *descriptors)
{
	while (size >= 2) {
		int tag = data[0];
		int length = data[1];

		if (length + 2 > size) {
			qCDebug(logIsdbSi, "Truncated descriptor 0x%02x", tag);
			return;
		}

		const unsigned char *payload = data + 2;

		switch (tag) {
		case IsdbDescriptorBase::NetworkName: {
			IsdbNetworkNameDescriptor descriptor;
			descriptor.networkName = IsdbSiText::convertText(
				reinterpret_cast<const char *>(payload), length);
			descriptors->append(IsdbDescriptor(descriptor));
			break;
		    }
		case IsdbDescriptorBase::SatelliteDeliverySystem: {
			if (length < 11) {
				qCDebug(logIsdbSi, "Invalid satellite delivery system descriptor");
				break;
			}

			IsdbSatelliteDeliverySystemDescriptor descriptor;
			descriptor.frequency = bcdValue(payload, 8) / 100000.0;
			descriptor.orbitalPosition = bcdValue(payload + 4, 4);
			descriptor.westEastFlag = ((payload[6] & 0x80) != 0);
			descriptor.polarization = ((payload[6] >> 5) & 0x03);
			descriptor.symbolRate = bcdValue(payload + 7, 7) / 10;
			descriptors->append(IsdbDescriptor(descriptor));
			break;
		    }
		case IsdbDescriptorBase::Service: {
			if (length < 2) {
				qCDebug(logIsdbSi, "Invalid service descriptor");
				break;
			}

			int providerNameLength = payload[1];

			if (providerNameLength + 3 > length) {
				qCDebug(logIsdbSi, "Invalid service descriptor");
				break;
			}

			int serviceNameLength = payload[providerNameLength + 2];

			if (providerNameLength + serviceNameLength + 3 > length) {
				qCDebug(logIsdbSi, "Invalid service descriptor");
				break;
			}

			IsdbServiceDescriptor descriptor;
			descriptor.serviceType = payload[0];
			descriptor.providerName = IsdbSiText::convertText(
				reinterpret_cast<const char *>(payload + 2), providerNameLength);
			descriptor.serviceName = IsdbSiText::convertText(
				reinterpret_cast<const char *>(payload + providerNameLength + 3),
				serviceNameLength);
			descriptors->append(IsdbDescriptor(descriptor));
			break;
		    }
		case IsdbDescriptorBase::TsInformation: {
			if (length < 2) {
				qCDebug(logIsdbSi, "Invalid ts information descriptor");
				break;
			}

			int tsNameLength = (payload[1] >> 2);

			if (tsNameLength + 2 > length) {
				qCDebug(logIsdbSi, "Invalid ts information descriptor");
				break;
			}

			IsdbTsInformationDescriptor descriptor;
			descriptor.remoteControlKeyId = payload[0];
			descriptor.tsName = IsdbSiText::convertText(
				reinterpret_cast<const char *>(payload + 2), tsNameLength);
			descriptors->append(IsdbDescriptor(descriptor));
			break;
		    }
		case IsdbDescriptorBase::PartialReception: {
			IsdbPartialReceptionDescriptor descriptor;

			for (int i = 0; i + 1 < length; i += 2) {
				descriptor.serviceIds.append((payload[i] << 8) | payload[i + 1]);
			}

			descriptors->append(IsdbDescriptor(descriptor));
			break;
		    }
		}

		data += (length + 2);
		size -= (length + 2);
	}
}

bool IsdbSiParser::parseNitSection(const char *data_, int size, IsdbNitRecord *record)
{
	const unsigned char *data = reinterpret_cast<const unsigned char *>(data_);

	// header, descriptor loop lengths and crc
	if (size < 16) {
		return false;
	}

	record->networkId = ((data[3] << 8) | data[4]);

	int networkDescriptorsLength = (((data[8] & 0x0f) << 8) | data[9]);
	int end = (size - 4);

	if (10 + networkDescriptorsLength + 2 > end) {
		return false;
	}

	parseDescriptors(data + 10, networkDescriptorsLength, &record->networkDescriptors);

	int position = (10 + networkDescriptorsLength);
	int loopLength = (((data[position] & 0x0f) << 8) | data[position + 1]);
	position += 2;

	if (position + loopLength > end) {
		return false;
	}

	end = position + loopLength;

	while (position + 6 <= end) {
		IsdbNitEntry entry;
		entry.transportStreamId = ((data[position] << 8) | data[position + 1]);
		entry.originalNetworkId = ((data[position + 2] << 8) | data[position + 3]);
		int descriptorsLength = (((data[position + 4] & 0x0f) << 8) | data[position + 5]);
		position += 6;

		if (position + descriptorsLength > end) {
			return false;
		}

		parseDescriptors(data + position, descriptorsLength, &entry.descriptors);
		record->transportStreams.append(entry);
		position += descriptorsLength;
	}

	return true;
}

bool IsdbSiParser::parseSdtSection(const char *data_, int size, IsdbSdtRecord *record)
{
	const unsigned char *data = reinterpret_cast<const unsigned char *>(data_);

	if (size < 15) {
		return false;
	}

	record->transportStreamId = ((data[3] << 8) | data[4]);
	record->originalNetworkId = ((data[8] << 8) | data[9]);

	int position = 11;
	int end = (size - 4);

	while (position + 5 <= end) {
		IsdbSdtEntry entry;
		entry.serviceId = ((data[position] << 8) | data[position + 1]);
		entry.freeCaMode = ((data[position + 3] & 0x10) != 0);
		int descriptorsLength = (((data[position + 3] & 0x0f) << 8) | data[position + 4]);
		position += 5;

		if (position + descriptorsLength > end) {
			return false;
		}

		parseDescriptors(data + position, descriptorsLength, &entry.descriptors);
		record->services.append(entry);
		position += descriptorsLength;
	}

	return true;
}

bool IsdbSiParser::checkSection(const QByteArray &section)
{
	if (section.size() < 12) {
		return false;
	}

	const unsigned char *data = reinterpret_cast<const unsigned char *>(section.constData());

	if ((data[5] & 0x01) == 0) {
		// not yet applicable
		return false;
	}

	// table id, table id extension, version and section number
	quint64 key = (quint64(data[0]) << 32) | (quint64(data[3]) << 24) |
		(quint64(data[4]) << 16) | (quint64((data[5] >> 1) & 0x1f) << 8) | data[6];

	if (seenSections.contains(key)) {
		return false;
	}

	seenSections.insert(key);
	return true;
}

IsdbSiRecords IsdbSiParser::decode(const QByteArray &data)
{
	IsdbSiRecords records;
	IsdbSectionAssembler nitAssembler;
	IsdbSectionAssembler sdtAssembler;
	const char *begin = data.constData();
	int size = data.size();
	int position = 0;

	seenSections.clear();

	while (position + 188 <= size) {
		if ((begin[position] != 0x47) ||
		    ((position + 188 < size) && (begin[position + 188] != 0x47))) {
			// lost synchronisation
			++position;
			continue;
		}

		const char *packet = (begin + position);
		int pid = (((static_cast<unsigned char>(packet[1]) & 0x1f) << 8) |
			static_cast<unsigned char>(packet[2]));

		if ((packet[1] & 0x80) == 0) {
			if (pid == NitPid) {
				nitAssembler.processData(packet);
			} else if (pid == SdtPid) {
				sdtAssembler.processData(packet);
			}
		}

		position += 188;
	}

	foreach (const QByteArray &section, nitAssembler.takeSections()) {
		if ((static_cast<unsigned char>(section.at(0)) != ActualNitTable) ||
		    !checkSection(section)) {
			continue;
		}

		IsdbNitRecord record;

		if (!parseNitSection(section.constData(), section.size(), &record)) {
			qCWarning(logIsdbSi, "Invalid NIT section");
			continue;
		}

		records.nitRecords.append(record);
	}

	foreach (const QByteArray &section, sdtAssembler.takeSections()) {
		unsigned char tableId = static_cast<unsigned char>(section.at(0));

		// the other transport streams of a satellite network are only described
		// by the sdt other; the bat shares the pid
		if (((tableId != ActualSdtTable) && (tableId != OtherSdtTable)) ||
		    !checkSection(section)) {
			continue;
		}

		IsdbSdtRecord record;

		if (!parseSdtSection(section.constData(), section.size(), &record)) {
			qCWarning(logIsdbSi, "Invalid SDT section");
			continue;
		}

		records.sdtRecords.append(record);
	}

	qCDebug(logIsdbSi, "Decoded %d NIT and %d SDT sections from %d bytes",
		records.nitRecords.size(), records.sdtRecords.size(), size);
	return records;
}
