/*
 * isdbtuner.cpp
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

#include <QElapsedTimer>
#include <QRegularExpression>
#include <QScopedPointer>
#include <QStringList>
#include <stdio.h>

#include "isdbprocess.h"
#include "isdbtuner.h"

IsdbTuningTimer::State IsdbTuningTimer::update(bool dataReceived, double seconds)
{
	if (state != AwaitingFirstByte) {
		return state;
	}

	if (dataReceived) {
		state = Streaming;
		return state;
	}

	elapsed += seconds;

	if (elapsed >= timeout) {
		state = TimedOut;
	}

	return state;
}

// collects the diagnostic output of the helper, echoing it if requested
static void collectStandardError(IsdbProcess *process, bool echo, QByteArray *standardError)
{
	QByteArray data = process->readStandardError();

	if (echo && !data.isEmpty()) {
		fwrite(data.constData(), 1, data.size(), stderr);
		fflush(stderr);
	}

	standardError->append(data);
}

IsdbSignalLevelReader::~IsdbSignalLevelReader()
{
	stop();
	delete process;
}

bool IsdbSignalLevelReader::readLine(QByteArray *line)
{
	while (true) {
		int index = pending.indexOf('\r');

		if (index < 0) {
			index = pending.indexOf('\n');
		}

		if (index >= 0) {
			*line = pending.left(index);
			pending.remove(0, index + 1);
			return true;
		}

		// sampled first, so that no output is left once it reports the exit
		bool running = process->isRunning();
		QByteArray data = process->readStandardOutput();

		if (data.isEmpty()) {
			if (!running) {
				return false;
			}

			process->waitForOutput(100);
			continue;
		}

		pending.append(data);
	}
}

bool IsdbSignalLevelReader::next(double *level)
{
	static const QRegularExpression levelRegExp(QLatin1String("(\\d+\\.\\d+)dB"));

	while (!stopped) {
		QByteArray line;

		if (!readLine(&line)) {
			// tuning failed or the helper was terminated
			stop();
			return false;
		}

		QRegularExpressionMatch match = levelRegExp.match(QString::fromUtf8(line).trimmed());

		if (match.hasMatch()) {
			*level = match.captured(1).toDouble();
			return true;
		}
	}

	return false;
}

void IsdbSignalLevelReader::stop()
{
	if (stopped) {
		return;
	}

	stopped = true;

	// the device stays busy until the helper is gone
	process->interrupt();
	process->waitForFinished();
}

IsdbTuner::IsdbTuner(const QString &devicePath_, DeviceType deviceType_, TunerType type_,
	const QString &name_, IsdbProcessFactory *processFactory_) : devicePath(devicePath_),
	deviceType(deviceType_), type(type_), name(name_), processFactory(processFactory_),
	recisdbPath(QLatin1String("recisdb")), outputRecisdbLog(false),
	minimumOutputSize(100 * 1024), openingFailed(false)
{
}

IsdbTuner::~IsdbTuner()
{
}

QString IsdbTuner::toRecisdbChannel(const QString &physicalChannel)
{
	static const QRegularExpression bsRegExp(QLatin1String("^BS(\\d{2})/TS(\\d)$"));
	QRegularExpressionMatch match = bsRegExp.match(physicalChannel);

	if (match.hasMatch()) {
		return QString(QLatin1String("BS%1_%2")).arg(match.captured(1), match.captured(2));
	}

	if (physicalChannel.startsWith(QLatin1String("ND"))) {
		return QLatin1String("CS") + physicalChannel.mid(2);
	}

	return physicalChannel;
}

QString IsdbTuner::tunerTypeName(TunerType type)
{
	switch (type) {
	case IsdbT:
		return QLatin1String("Terrestrial");
	case IsdbS:
		return QLatin1String("Satellite");
	case IsdbTS:
		return QLatin1String("Multi");
	}

	return QString();
}

IsdbTuner::TuneError IsdbTuner::classifyError(const QByteArray &standardError,
	QString *errorString)
{
	static const QRegularExpression errorRegExp(QLatin1String("ERROR:\\s+(.+)"));
	QRegularExpressionMatch match = errorRegExp.match(QString::fromUtf8(standardError));

	if (match.hasMatch()) {
		*errorString = match.captured(1).trimmed();
	} else {
		*errorString = QLatin1String("Channel selection failed due to an unknown error.");
	}

	if ((*errorString == QLatin1String("The tuner device does not exist.")) ||
	    (*errorString == QLatin1String("The tuner device is already in use.")) ||
	    (*errorString == QLatin1String("The tuner device is busy.")) ||
	    (*errorString == QLatin1String("The tuner device does not support the ioctl system call.")) ||
	    errorString->startsWith(QLatin1String("Cannot open the device."))) {
		return OpeningError;
	}

	return TuningError;
}

IsdbTuner::TuneError IsdbTuner::capture(const QString &physicalChannel, int recordingTime,
	double tuneTimeout, QByteArray *data, QString *errorString)
{
	openingFailed = false;
	data->clear();

	QScopedPointer<IsdbProcess> process(processFactory->createProcess());
	QStringList arguments;
	arguments << QLatin1String("tune") << QLatin1String("--device") << devicePath <<
		QLatin1String("--channel") << toRecisdbChannel(physicalChannel) <<
		QLatin1String("--time") << QString::number(recordingTime) << QLatin1String("-");
	process->setStandardErrorMode(IsdbProcess::PipeStandardError);

	if (!process->start(recisdbPath, arguments)) {
		// without the helper this tuner is of no use
		openingFailed = true;
		*errorString = i18n("Cannot start %1: %2", recisdbPath, process->errorString());
		return OpeningError;
	}

	QByteArray output;
	QByteArray standardError;
	IsdbTuningTimer timer(tuneTimeout);
	QElapsedTimer clock;
	clock.start();

	while (process->isRunning()) {
		process->waitForOutput(10);
		output.append(process->readStandardOutput());
		collectStandardError(process.data(), outputRecisdbLog, &standardError);

		double seconds = clock.restart() / 1000.0;

		if (timer.update(!output.isEmpty(), seconds) == IsdbTuningTimer::TimedOut) {
			qCDebug(logTuner, "Tuning %s on %s timed out after %.2f seconds",
				qPrintable(physicalChannel), qPrintable(devicePath), timer.getElapsed());
			process->interrupt();
			process->waitForFinished();
			collectStandardError(process.data(), outputRecisdbLog, &standardError);
			*errorString = QLatin1String("Channel selection timed out.");
			return TuningTimeout;
		}
	}

	int exitCode = process->waitForFinished();
	output.append(process->readStandardOutput());
	collectStandardError(process.data(), outputRecisdbLog, &standardError);

	if (exitCode != 0) {
		TuneError error = classifyError(standardError, errorString);

		if (error == OpeningError) {
			openingFailed = true;
		}

		qCDebug(logTuner, "recisdb exited with code %d: %s", exitCode, qPrintable(*errorString));
		return error;
	}

	*data = output;

	// opening the tuner alone yields far more than this on any real channel
	if (data->size() < minimumOutputSize) {
		qCDebug(logTuner, "Only %d bytes received on %s", data->size(),
			qPrintable(physicalChannel));
		data->clear();
		*errorString = QLatin1String("The tuner output is too small.");
		return OutputTooSmall;
	}

	return NoError;
}

IsdbSignalLevelReader *IsdbTuner::startSignalLevel(const QString &physicalChannel)
{
	IsdbProcess *process = processFactory->createProcess();
	QStringList arguments;
	arguments << QLatin1String("checksignal") << QLatin1String("--device") << devicePath <<
		QLatin1String("--channel") << toRecisdbChannel(physicalChannel);

	if (outputRecisdbLog) {
		process->setStandardErrorMode(IsdbProcess::ForwardStandardError);
	} else {
		process->setStandardErrorMode(IsdbProcess::DiscardStandardError);
	}

	if (!process->start(recisdbPath, arguments)) {
		qCWarning(logTuner, "Cannot start %s: %s", qPrintable(recisdbPath),
			qPrintable(process->errorString()));
		delete process;
		return NULL;
	}

	return new IsdbSignalLevelReader(process);
}

bool IsdbTuner::getSignalLevelMean(const QString &physicalChannel, double *mean)
{
	QScopedPointer<IsdbSignalLevelReader> reader(startSignalLevel(physicalChannel));

	if (reader.isNull()) {
		return false;
	}

	double sum = 0;

	for (int i = 0; i < 5; ++i) {
		double level;

		if (!reader->next(&level)) {
			return false;
		}

		sum += level;
	}

	reader->stop();
	*mean = sum / 5;
	return true;
}
