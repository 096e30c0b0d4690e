/*
 * isdbanalyzer.h
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

#ifndef ISDBANALYZER_H
#define ISDBANALYZER_H

#include "isdbchannel.h"

class IsdbNitRecord;
class IsdbSdtRecord;
class IsdbSiRecords;

// transport streams of one capture, unique by transport stream id
class IsdbTransportStreamMap
{
public:
	IsdbTransportStreamMap() { }
	~IsdbTransportStreamMap() { }

	IsdbTransportStreamInfo *find(int transportStreamId);
	IsdbTransportStreamInfo *findOrInsert(int transportStreamId, bool *inserted = NULL);

	int size() const
	{
		return transportStreams.size();
	}

	QList<IsdbTransportStreamInfo> &list()
	{
		return transportStreams;
	}

private:
	QList<IsdbTransportStreamInfo> transportStreams; // insertion order
};

class IsdbTransportStreamAnalyzer
{
public:
	/*
	 * builds the transport streams and services described by the records of
	 * one capture; on failure nothing is appended and errorString is set
	 */
	static bool analyze(const IsdbSiRecords &records, const QString &tunedPhysicalChannel,
		QList<IsdbTransportStreamInfo> *result, QString *errorString);

	static QString bsPhysicalChannel(int transponder, int slot);
	static QString csPhysicalChannel(int transponder);

	// category * 200 + remote control key id * 10 + index + 1
	static QString terrestrialChannelNumber(int serviceId, int remoteControlKeyId);

private:
	IsdbTransportStreamAnalyzer();
	~IsdbTransportStreamAnalyzer();

	static bool processNit(const IsdbNitRecord &record, IsdbTransportStreamMap *map,
		QString *errorString);
	static bool processSdt(const IsdbSdtRecord &record, IsdbTransportStreamMap *map,
		QString *errorString);
	static void renumberBsSlots(IsdbTransportStreamMap *map);
	static void assignChannelNumbers(IsdbTransportStreamInfo *transportStream);
};

#endif /* ISDBANALYZER_H */
