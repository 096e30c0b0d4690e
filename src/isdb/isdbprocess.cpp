/*
 * isdbprocess.cpp
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
#include <errno.h>
#include <signal.h>
#include <string.h>

#include "isdbprocess.h"

// krazy:excludeall=syscalls

IsdbHelperProcess::~IsdbHelperProcess()
{
	if (process.state() != QProcess::NotRunning) {
		qCWarning(logTuner, "Helper process %lld still running, interrupting it",
			qint64(process.processId()));
		interrupt();

		if (!process.waitForFinished(3000)) {
			process.kill();
			process.waitForFinished();
		}
	}
}

void IsdbHelperProcess::setStandardErrorMode(StandardErrorMode mode)
{
	switch (mode) {
	case PipeStandardError:
		process.setProcessChannelMode(QProcess::SeparateChannels);
		break;
	case DiscardStandardError:
		process.setProcessChannelMode(QProcess::SeparateChannels);
		process.setStandardErrorFile(QProcess::nullDevice());
		break;
	case ForwardStandardError:
		process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
		break;
	}
}

bool IsdbHelperProcess::start(const QString &program, const QStringList &arguments)
{
	process.start(program, arguments, QIODevice::ReadOnly);

	if (!process.waitForStarted(-1)) {
		return false;
	}

	qCDebug(logTuner, "Started %s (pid %lld): %s", qPrintable(program),
		qint64(process.processId()), qPrintable(arguments.join(QLatin1Char(' '))));
	return true;
}

bool IsdbHelperProcess::waitForOutput(int msecs)
{
	if (process.bytesAvailable() > 0) {
		return true;
	}

	QElapsedTimer timer;
	timer.start();

	// also collects the diagnostic stream and notices the exit of the process
	if (process.waitForReadyRead(msecs)) {
		return true;
	}

	// returns at once if standard output was closed before the exit
	int remaining = msecs - int(timer.elapsed());

	if ((process.state() != QProcess::NotRunning) && (remaining > 0)) {
		process.waitForFinished(remaining);
	}

	return false;
}

QByteArray IsdbHelperProcess::readStandardOutput()
{
	return process.readAllStandardOutput();
}

QByteArray IsdbHelperProcess::readStandardError()
{
	return process.readAllStandardError();
}

bool IsdbHelperProcess::isRunning()
{
	return (process.state() != QProcess::NotRunning);
}

void IsdbHelperProcess::interrupt()
{
	if (process.state() == QProcess::NotRunning) {
		return;
	}

	// terminate() would send SIGTERM
	if (::kill(pid_t(process.processId()), SIGINT) != 0) {
		qCWarning(logTuner, "Cannot interrupt pid %lld: %s", qint64(process.processId()),
			strerror(errno));
	}
}

int IsdbHelperProcess::waitForFinished()
{
	if (process.state() != QProcess::NotRunning) {
		process.waitForFinished(-1);
	}

	if (process.exitStatus() == QProcess::CrashExit) {
		return -1;
	}

	return process.exitCode();
}
