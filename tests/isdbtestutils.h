/*
 * isdbtestutils.h
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

#ifndef ISDBTESTUTILS_H
#define ISDBTESTUTILS_H

#include <QMap>
#include <QStringList>
#include <QThread>

#include "isdb/isdbprocess.h"
#include "isdb/isdbsi.h"
#include "isdb/isdbsiparser.h"

/*
 * scripted stand-in for recisdb
 *
 * standard output is handed out chunk by chunk; a hanging process only exits
 * after interrupt(), the others exit as soon as both streams are read
 */

class FakeProcessScript
{
public:
	FakeProcessScript() : startFails(false), hangs(false), exitCode(0) { }

	static FakeProcessScript output(const QByteArray &data)
	{
		FakeProcessScript script;
		script.standardOutput.append(data);
		return script;
	}

	static FakeProcessScript failure(const QByteArray &standardError, int exitCode = 1)
	{
		FakeProcessScript script;
		script.standardError = standardError;
		script.exitCode = exitCode;
		return script;
	}

	// no data until interrupted, as on a channel without signal
	static FakeProcessScript silence()
	{
		FakeProcessScript script;
		script.hangs = true;
		return script;
	}

	static FakeProcessScript signalLevels(const QList<double> &levels, bool hangs = true)
	{
		FakeProcessScript script;
		script.hangs = hangs;

		foreach (double level, levels) {
			script.standardOutput.append(
				QString(QLatin1String("Signal: %1dB\r")).arg(level, 0, 'f', 2).toLatin1());
		}

		return script;
	}

	bool startFails;
	bool hangs;
	int exitCode;
	QList<QByteArray> standardOutput;
	QByteArray standardError;
};

class FakeProcessFactory;

class FakeProcess : public IsdbProcess
{
public:
	explicit FakeProcess(FakeProcessFactory *factory_) : factory(factory_),
		standardErrorMode(PipeStandardError), started(false), interrupted(false) { }
	~FakeProcess() { }

	void setStandardErrorMode(StandardErrorMode mode) override
	{
		standardErrorMode = mode;
	}

	bool start(const QString &program, const QStringList &arguments) override;

	QString errorString() const override
	{
		return QLatin1String("No such file or directory");
	}

	bool waitForOutput(int msecs) override
	{
		if (!script.standardOutput.isEmpty()) {
			return true;
		}

		if (isRunning()) {
			QThread::msleep(msecs);
		}

		return false;
	}

	QByteArray readStandardOutput() override
	{
		if (!script.standardOutput.isEmpty()) {
			return script.standardOutput.takeFirst();
		}

		return QByteArray();
	}

	QByteArray readStandardError() override
	{
		QByteArray data = script.standardError;
		script.standardError.clear();
		return data;
	}

	bool isRunning() override
	{
		if (!started || interrupted) {
			return false;
		}

		if (script.hangs) {
			return true;
		}

		return !(script.standardOutput.isEmpty() && script.standardError.isEmpty());
	}

	void interrupt() override;

	int waitForFinished() override
	{
		return interrupted ? 130 : script.exitCode;
	}

private:
	FakeProcessFactory *factory;
	FakeProcessScript script;
	StandardErrorMode standardErrorMode;
	bool started;
	bool interrupted;
};

/*
 * scripts are looked up by "<command> <channel>", e.g. "tune T13" or
 * "checksignal BS01_0"; unknown channels get the default script
 */

class FakeProcessFactory : public IsdbProcessFactory
{
public:
	FakeProcessFactory() : defaultScript(FakeProcessScript::silence()), interruptCount(0) { }
	~FakeProcessFactory() { }

	IsdbProcess *createProcess() override
	{
		return new FakeProcess(this);
	}

	void setScript(const QString &command, const QString &channel,
		const FakeProcessScript &script)
	{
		scripts.insert(command + QLatin1Char(' ') + channel, script);
	}

	FakeProcessScript scriptFor(const QStringList &arguments) const
	{
		int index = arguments.indexOf(QLatin1String("--channel"));
		QString channel;

		if ((index >= 0) && (index + 1 < arguments.size())) {
			channel = arguments.at(index + 1);
		}

		return scripts.value(arguments.value(0) + QLatin1Char(' ') + channel, defaultScript);
	}

	FakeProcessScript defaultScript;
	QMap<QString, FakeProcessScript> scripts;
	QList<QStringList> startedCommands; // program followed by its arguments
	int interruptCount;
};

inline bool FakeProcess::start(const QString &program, const QStringList &arguments)
{
	script = factory->scriptFor(arguments);
	factory->startedCommands.append(QStringList() << program << arguments);

	if (script.startFails) {
		return false;
	}

	started = true;
	return true;
}

inline void FakeProcess::interrupt()
{
	if (!interrupted) {
		interrupted = true;
		++factory->interruptCount;
	}
}

// hands out prepared records for known capture contents
class FakeSiDecoder : public IsdbSiDecoder
{
public:
	FakeSiDecoder() { }
	~FakeSiDecoder() { }

	IsdbSiRecords decode(const QByteArray &data) override
	{
		return records.value(data);
	}

	QMap<QByteArray, IsdbSiRecords> records;
};

inline IsdbDescriptorMap tsInformationDescriptors(int remoteControlKeyId, const QString &tsName,
	const QList<int> &onesegServiceIds = QList<int>())
{
	IsdbDescriptorMap descriptors;
	IsdbTsInformationDescriptor tsInformation;
	tsInformation.remoteControlKeyId = remoteControlKeyId;
	tsInformation.tsName = tsName;
	descriptors.append(IsdbDescriptor(tsInformation));

	if (!onesegServiceIds.isEmpty()) {
		IsdbPartialReceptionDescriptor partialReception;
		partialReception.serviceIds = onesegServiceIds;
		descriptors.append(IsdbDescriptor(partialReception));
	}

	return descriptors;
}

inline IsdbSdtEntry sdtEntry(int serviceId, int serviceType, const QString &serviceName,
	bool freeCaMode = false)
{
	IsdbSdtEntry entry;
	entry.serviceId = serviceId;
	entry.freeCaMode = freeCaMode;

	IsdbServiceDescriptor service;
	service.serviceType = serviceType;
	service.serviceName = serviceName;
	entry.descriptors.append(IsdbDescriptor(service));
	return entry;
}

// NIT and SDT of a terrestrial transport stream with one tv service
inline IsdbSiRecords terrestrialRecords(int transportStreamId, int remoteControlKeyId,
	const QString &tsName, int serviceId)
{
	IsdbSiRecords records;

	IsdbNitEntry nitEntry;
	nitEntry.transportStreamId = transportStreamId;
	nitEntry.originalNetworkId = 0x7fe0;
	nitEntry.descriptors = tsInformationDescriptors(remoteControlKeyId, tsName);

	IsdbNitRecord nit;
	nit.networkId = 0x7fe0;
	nit.transportStreams.append(nitEntry);
	records.nitRecords.append(nit);

	IsdbSdtRecord sdt;
	sdt.transportStreamId = transportStreamId;
	sdt.originalNetworkId = 0x7fe0;
	sdt.services.append(sdtEntry(serviceId, 0x01, tsName));
	records.sdtRecords.append(sdt);
	return records;
}

#endif /* ISDBTESTUTILS_H */
