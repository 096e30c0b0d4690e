/*
 * isdbscan.cpp
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

#include "../log.h"

#include <QMap>
#include <algorithm>
#include <limits>

#include "isdbanalyzer.h"
#include "isdbscan.h"
#include "isdbsiparser.h"
#include "isdbtuner.h"

const double IsdbScan::unmeasurableSignalLevel = -std::numeric_limits<double>::max();

static bool lessThanPhysicalChannel(const IsdbTransportStreamInfo &x,
	const IsdbTransportStreamInfo &y)
{
	return (x.physicalChannel < y.physicalChannel);
}

IsdbScan::IsdbScan(const QList<IsdbTuner *> &terrestrialTuners_,
	const QList<IsdbTuner *> &satelliteTuners_, IsdbSiDecoder *decoder_, QObject *parent) :
	QObject(parent), terrestrialTuners(terrestrialTuners_), satelliteTuners(satelliteTuners_),
	decoder(decoder_), firstTerrestrialChannel(13), lastTerrestrialChannel(62),
	terrestrialRecordingTime(4), satelliteRecordingTime(20), tuneTimeout(7.0)
{
}

IsdbScan::~IsdbScan()
{
}

void IsdbScan::setTerrestrialChannelRange(int first, int last)
{
	firstTerrestrialChannel = first;
	lastTerrestrialChannel = last;
}

void IsdbScan::setRecordingTimes(int terrestrialRecordingTime_, int satelliteRecordingTime_)
{
	terrestrialRecordingTime = terrestrialRecordingTime_;
	satelliteRecordingTime = satelliteRecordingTime_;
}

void IsdbScan::setTuneTimeout(double tuneTimeout_)
{
	tuneTimeout = tuneTimeout_;
}

QStringList IsdbScan::terrestrialChannels() const
{
	QStringList channels;

	// 53 - 62 are still used by some catv community channels
	for (int channel = firstTerrestrialChannel; channel <= lastTerrestrialChannel; ++channel) {
		channels.append(QString(QLatin1String("T%1")).arg(channel));
	}

	return channels;
}

QStringList IsdbScan::satelliteChannels()
{
	QStringList channels;
	channels << QLatin1String("BS01/TS0") << QLatin1String("ND02") << QLatin1String("ND04");
	return channels;
}

bool IsdbScan::scanChannel(const QString &physicalChannel, const QList<IsdbTuner *> &tuners,
	int recordingTime, QList<IsdbTransportStreamInfo> *result)
{
	foreach (IsdbTuner *tuner, tuners) {
		if (isBlacklisted(tuner)) {
			continue;
		}

		qCInfo(logScan, "Channel: %s, tuner: %s (%s)", qPrintable(physicalChannel),
			qPrintable(tuner->getName()), qPrintable(tuner->getDevicePath()));

		QByteArray data;
		QString errorString;
		IsdbTuner::TuneError error = tuner->capture(physicalChannel, recordingTime, tuneTimeout,
			&data, &errorString);

		switch (error) {
		case IsdbTuner::NoError:
			break;
		case IsdbTuner::OpeningError:
			if (tuner->lastOpeningFailed()) {
				blacklistedTuners.insert(tuner);
			}

			qCWarning(logScan, "Failed to open tuner. %s", qPrintable(errorString));
			qCWarning(logScan, "Trying again with the next tuner...");
			continue;
		case IsdbTuner::TuningError:
		case IsdbTuner::TuningTimeout:
			qCWarning(logScan, "%s", qPrintable(errorString));
			qCWarning(logScan, "Trying again with the next tuner...");
			continue;
		case IsdbTuner::OutputTooSmall:
			qCWarning(logScan, "Failed to receive data.");
			qCWarning(logScan, "Trying again with the next tuner...");
			continue;
		}

		IsdbSiRecords records = decoder->decode(data);
		QList<IsdbTransportStreamInfo> transportStreams;

		if (!IsdbTransportStreamAnalyzer::analyze(records, physicalChannel, &transportStreams,
		    &errorString)) {
			qCWarning(logScan, "Failed to analyze transport stream. %s",
				qPrintable(errorString));
			qCWarning(logScan, "Trying again with the next tuner...");
			continue;
		}

		result->append(transportStreams);
		emit foundTransportStreams(transportStreams);
		return true;
	}

	qCWarning(logScan, "Channel %s may not be received in your area. Skipping...",
		qPrintable(physicalChannel));
	return false;
}

double IsdbScan::measureSignalLevel(const QString &physicalChannel)
{
	foreach (IsdbTuner *tuner, terrestrialTuners) {
		if (isBlacklisted(tuner)) {
			continue;
		}

		double level;

		if (tuner->getSignalLevelMean(physicalChannel, &level)) {
			qCInfo(logScan, "Signal level of %s: %.2f dB", qPrintable(physicalChannel), level);
			return level;
		}
	}

	qCWarning(logScan, "Cannot measure the signal level of %s", qPrintable(physicalChannel));
	return unmeasurableSignalLevel;
}

void IsdbScan::removeDuplicates(QList<IsdbTransportStreamInfo> *transportStreams)
{
	QMap<int, QList<int> > indexes;

	for (int i = 0; i < transportStreams->size(); ++i) {
		indexes[transportStreams->at(i).transportStreamId].append(i);
	}

	QMap<QString, double> signalLevels;
	QList<int> removedIndexes;

	for (QMap<int, QList<int> >::const_iterator it = indexes.constBegin();
	     it != indexes.constEnd(); ++it) {
		const QList<int> &group = it.value();

		if (group.size() < 2) {
			continue;
		}

		// regional relay stations rebroadcast the same stream on other channels
		qCInfo(logScan, "Transport stream 0x%04x received on %d channels", it.key(),
			group.size());

		int bestIndex = -1;
		double bestLevel = 0;

		foreach (int index, group) {
			const QString &physicalChannel = transportStreams->at(index).physicalChannel;

			if (!signalLevels.contains(physicalChannel)) {
				signalLevels.insert(physicalChannel, measureSignalLevel(physicalChannel));
			}

			double level = signalLevels.value(physicalChannel);

			if ((bestIndex < 0) || (level > bestLevel)) {
				bestIndex = index;
				bestLevel = level;
			}
		}

		foreach (int index, group) {
			if (index != bestIndex) {
				qCInfo(logScan, "Dropping %s in favour of %s",
					qPrintable(transportStreams->at(index).physicalChannel),
					qPrintable(transportStreams->at(bestIndex).physicalChannel));
				removedIndexes.append(index);
			}
		}
	}

	std::sort(removedIndexes.begin(), removedIndexes.end());

	for (int i = removedIndexes.size() - 1; i >= 0; --i) {
		transportStreams->removeAt(removedIndexes.at(i));
	}
}

IsdbScanResult IsdbScan::scan()
{
	IsdbScanResult result;
	QStringList channels = terrestrialChannels();
	int totalChannels = channels.size() + satelliteChannels().size();
	int scannedChannels = 0;

	blacklistedTuners.clear();
	emit scanProgress(scannedChannels, totalChannels);

	if (terrestrialTuners.isEmpty()) {
		qCWarning(logScan, "No ISDB-T tuner found, skipping terrestrial channels");
		scannedChannels += channels.size();
		emit scanProgress(scannedChannels, totalChannels);
	} else {
		qCInfo(logScan, "Scanning ISDB-T (Terrestrial) channels...");

		foreach (const QString &channel, channels) {
			scanChannel(channel, terrestrialTuners, terrestrialRecordingTime, &result.terrestrial);
			emit scanProgress(++scannedChannels, totalChannels);
		}

		removeDuplicates(&result.terrestrial);
		std::stable_sort(result.terrestrial.begin(), result.terrestrial.end(),
			lessThanPhysicalChannel);
	}

	if (satelliteTuners.isEmpty()) {
		qCWarning(logScan, "No ISDB-S tuner found, skipping satellite channels");
	} else {
		qCInfo(logScan, "Scanning ISDB-S (Satellite) channels...");

		foreach (const QString &channel, satelliteChannels()) {
			QList<IsdbTransportStreamInfo> transportStreams;
			scanChannel(channel, satelliteTuners, satelliteRecordingTime, &transportStreams);

			foreach (const IsdbTransportStreamInfo &transportStream, transportStreams) {
				if (transportStream.broadcastType() == IsdbTransportStreamInfo::Bs) {
					result.bs.append(transportStream);
				} else {
					result.cs.append(transportStream);
				}
			}

			emit scanProgress(++scannedChannels, totalChannels);
		}

		std::stable_sort(result.bs.begin(), result.bs.end(), lessThanPhysicalChannel);
		std::stable_sort(result.cs.begin(), result.cs.end(), lessThanPhysicalChannel);
	}

	emit scanProgress(totalChannels, totalChannels);
	return result;
}

#include "moc_isdbscan.cpp"
