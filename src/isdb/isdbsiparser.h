/*
 * isdbsiparser.h
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

#ifndef ISDBSIPARSER_H
#define ISDBSIPARSER_H

#include <QByteArray>
#include <QList>
#include <QSet>

#include "isdbsi.h"

// turns a captured transport stream into NIT / SDT records
class IsdbSiDecoder
{
public:
	IsdbSiDecoder() { }
	virtual ~IsdbSiDecoder() { }

	virtual IsdbSiRecords decode(const QByteArray &data) = 0;
};

// reassembles the sections carried on one pid
class IsdbSectionAssembler
{
public:
	IsdbSectionAssembler() : continuityCounter(0), bufferValid(false) { }
	~IsdbSectionAssembler() { }

	void processData(const char data[188]);

	// sections with a valid crc, in stream order
	QList<QByteArray> takeSections();

private:
	void processSections(bool force);

	unsigned char continuityCounter;
	bool bufferValid;
	QByteArray buffer;
	QList<QByteArray> sections;
};

class IsdbSiParser : public IsdbSiDecoder
{
public:
	IsdbSiParser() { }
	~IsdbSiParser() { }

	IsdbSiRecords decode(const QByteArray &data) override;

	// returns 0 if the crc of the section is correct
	static unsigned int verifyCrc32(const char *data, int size);

	static bool parseNitSection(const char *data, int size, IsdbNitRecord *record);
	static bool parseSdtSection(const char *data, int size, IsdbSdtRecord *record);
	static void parseDescriptors(const unsigned char *data, int size,
		IsdbDescriptorMap *descriptors);

private:
	enum Pid
	{
		NitPid = 0x10,
		SdtPid = 0x11
	};

	enum TableId
	{
		ActualNitTable = 0x40,
		ActualSdtTable = 0x42,
		OtherSdtTable = 0x46
	};

	bool checkSection(const QByteArray &section);

	QSet<quint64> seenSections;
};

#endif /* ISDBSIPARSER_H */
