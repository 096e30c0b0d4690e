/*
 * scanner.cpp
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

#include "log.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QElapsedTimer>

#include "configuration.h"
#include "isdb/isdbjsonwriter.h"
#include "isdb/isdbprocess.h"
#include "isdb/isdbscan.h"
#include "isdb/isdbsiparser.h"
#include "isdb/isdbtuner.h"
#include "isdb/isdbtunermanager.h"
#include "scanner.h"

#define CATEGORIES "config, dev, scan, si, tuner"

Scanner::Scanner(QCommandLineParser *parser_) : parser(parser_)
{
}

Scanner::~Scanner()
{
}

void Scanner::addOptions(QCommandLineParser *parser)
{
	parser->addOption(QCommandLineOption(QStringList() << QLatin1String("o") << QLatin1String("output"), i18n("Directory where Channels.json is written"), QLatin1String("directory"), QLatin1String(".")));
	parser->addOption(QCommandLineOption(QStringList() << QLatin1String("output-recisdb-log"), i18n("Show the messages of recisdb")));
	parser->addOption(QCommandLineOption(QStringList() << QLatin1String("exclude-pay-tv"), i18n("Leave pay tv services and all CS channels out of the result")));
	parser->addOption(QCommandLineOption(QStringList() << QLatin1String("d") << QLatin1String("debug"), i18n("Enable all debug messages. Debug messages can also be enabled per category, by using the environment var:\nQT_LOGGING_RULES=isdbscanner.category.debug=true\nwhere 'category' can be:\n" CATEGORIES)));
}

void Scanner::scanProgress(int scannedChannels, int totalChannels)
{
	qCDebug(logScan, "Scanned %d of %d channels", scannedChannels, totalChannels);
}

void Scanner::foundTransportStreams(const QList<IsdbTransportStreamInfo> &transportStreams)
{
	foreach (const IsdbTransportStreamInfo &transportStream, transportStreams) {
		qCInfo(logScan, "%s", qPrintable(transportStream.toString()));

		foreach (const IsdbServiceInfo &service, transportStream.services) {
			qCInfo(logScan, "    %s", qPrintable(service.toString()));
		}
	}
}

int Scanner::run()
{
	// handled first, as it affects the messages of the device scan
	Log::enableDebug(parser->isSet("debug"));

	QElapsedTimer timer;
	timer.start();

	Configuration *configuration = Configuration::instance();
	IsdbHelperProcessFactory processFactory;
	IsdbTunerManager tunerManager(&processFactory);
	tunerManager.scanDevices();

	QList<IsdbTuner *> tuners = tunerManager.getTerrestrialOnlyTuners() +
		tunerManager.getSatelliteOnlyTuners() + tunerManager.getMultiTuners();

	if (tuners.isEmpty()) {
		qCCritical(logScan, "No ISDB tuner found");
		Configuration::detach();
		return 1;
	}

	foreach (IsdbTuner *tuner, tuners) {
		qCInfo(logDev, "%s tuner: %s (%s, %s)",
			qPrintable(IsdbTuner::tunerTypeName(tuner->getType())),
			qPrintable(tuner->getName()), qPrintable(tuner->getDevicePath()),
			(tuner->getDeviceType() == IsdbTuner::ChardevDevice) ? "chardev" : "V4L-DVB");
		tuner->setRecisdbPath(configuration->getRecisdbPath());
		tuner->setOutputRecisdbLog(parser->isSet("output-recisdb-log"));
		tuner->setMinimumOutputSize(configuration->getMinimumOutputSize());
	}

	IsdbSiParser siParser;
	IsdbScan scan(tunerManager.getTerrestrialTuners(), tunerManager.getSatelliteTuners(),
		&siParser);
	scan.setTerrestrialChannelRange(configuration->getFirstTerrestrialChannel(),
		configuration->getLastTerrestrialChannel());
	scan.setRecordingTimes(configuration->getTerrestrialRecordingTime(),
		configuration->getSatelliteRecordingTime());
	scan.setTuneTimeout(configuration->getTuneTimeout());
	Configuration::detach();

	connect(&scan, SIGNAL(scanProgress(int,int)), this, SLOT(scanProgress(int,int)));
	connect(&scan, SIGNAL(foundTransportStreams(QList<IsdbTransportStreamInfo>)),
		this, SLOT(foundTransportStreams(QList<IsdbTransportStreamInfo>)));

	IsdbScanResult result = scan.scan();

	if (parser->isSet("exclude-pay-tv")) {
		result.excludePayTv();
	}

	qCInfo(logScan, "Found %d terrestrial, %d BS and %d CS transport streams",
		result.terrestrial.size(), result.bs.size(), result.cs.size());

	QDir outputDir(parser->value("output"));

	if (!outputDir.exists() && !outputDir.mkpath(QLatin1String("."))) {
		qCCritical(logScan, "Cannot create directory %s", qPrintable(outputDir.path()));
		return 1;
	}

	QString errorString;

	if (!IsdbJsonWriter::write(result, outputDir.filePath(QLatin1String("Channels.json")),
	    &errorString)) {
		qCCritical(logScan, "%s", qPrintable(errorString));
		return 1;
	}

	qCInfo(logScan, "Elapsed time: %.2f seconds", timer.elapsed() / 1000.0);
	return 0;
}

#include "moc_scanner.cpp"
