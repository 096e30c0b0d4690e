/*
 * isdbscan.h
 *
 * Copyright (C) 2008-2011 Christoph Pfister <christophpfister@gmail.com>
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

#ifndef ISDBSCAN_H
#define ISDBSCAN_H

#include <QObject>
#include <QSet>
#include <QStringList>

#include "isdbchannel.h"

class IsdbSiDecoder;
class IsdbTuner;

class IsdbScan : public QObject
{
	Q_OBJECT
public:
	IsdbScan(const QList<IsdbTuner *> &terrestrialTuners_,
		const QList<IsdbTuner *> &satelliteTuners_, IsdbSiDecoder *decoder_,
		QObject *parent = NULL);
	~IsdbScan();

	void setTerrestrialChannelRange(int first, int last);
	void setRecordingTimes(int terrestrialRecordingTime_, int satelliteRecordingTime_);
	void setTuneTimeout(double tuneTimeout_);

	// "T13" ... "T62"
	QStringList terrestrialChannels() const;

	// one channel per satellite network carries the NIT for all of its streams
	static QStringList satelliteChannels();

	// scans all channels; the results are ordered by physical channel
	IsdbScanResult scan();

	/*
	 * tries the tuners in turn until one of them delivers an analyzable
	 * capture; returns false if the channel could not be received at all
	 */
	bool scanChannel(const QString &physicalChannel, const QList<IsdbTuner *> &tuners,
		int recordingTime, QList<IsdbTransportStreamInfo> *result);

	/*
	 * keeps only the strongest of the terrestrial transport streams received
	 * on more than one physical channel
	 */
	void removeDuplicates(QList<IsdbTransportStreamInfo> *transportStreams);

	// a value below any real measurement if no tuner could measure the channel
	double measureSignalLevel(const QString &physicalChannel);

	static const double unmeasurableSignalLevel;

signals:
	void scanProgress(int scannedChannels, int totalChannels);
	void foundTransportStreams(const QList<IsdbTransportStreamInfo> &transportStreams);

private:
	bool isBlacklisted(IsdbTuner *tuner) const
	{
		return blacklistedTuners.contains(tuner);
	}

	QList<IsdbTuner *> terrestrialTuners;
	QList<IsdbTuner *> satelliteTuners;
	IsdbSiDecoder *decoder;

	int firstTerrestrialChannel;
	int lastTerrestrialChannel;
	int terrestrialRecordingTime;
	int satelliteRecordingTime;
	double tuneTimeout;

	// tuners which could not be opened during this run
	QSet<IsdbTuner *> blacklistedTuners;
};

#endif /* ISDBSCAN_H */
