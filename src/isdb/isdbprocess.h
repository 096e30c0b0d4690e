/*
 * isdbprocess.h
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

#ifndef ISDBPROCESS_H
#define ISDBPROCESS_H

#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

/*
 * a helper process with separate output and diagnostic streams
 *
 * the read functions return the data received so far without blocking;
 * waitForOutput() is the place where the caller blocks
 */

class IsdbProcess
{
public:
	IsdbProcess() { }
	virtual ~IsdbProcess() { }

	enum StandardErrorMode
	{
		PipeStandardError,
		DiscardStandardError,
		ForwardStandardError // inherited from this process
	};

	// call before start()
	virtual void setStandardErrorMode(StandardErrorMode mode) = 0;

	virtual bool start(const QString &program, const QStringList &arguments) = 0;
	virtual QString errorString() const = 0;

	// waits at most msecs for new standard output; false on timeout or exit
	virtual bool waitForOutput(int msecs) = 0;

	virtual QByteArray readStandardOutput() = 0;
	virtual QByteArray readStandardError() = 0;

	virtual bool isRunning() = 0;

	// asks the process to terminate (SIGINT)
	virtual void interrupt() = 0;

	// blocks until the process has exited; returns the exit code
	virtual int waitForFinished() = 0;
};

class IsdbProcessFactory
{
public:
	IsdbProcessFactory() { }
	virtual ~IsdbProcessFactory() { }

	virtual IsdbProcess *createProcess() = 0;
};

class IsdbHelperProcess : public IsdbProcess
{
public:
	IsdbHelperProcess() { }
	~IsdbHelperProcess();

	void setStandardErrorMode(StandardErrorMode mode) override;

	bool start(const QString &program, const QStringList &arguments) override;

	QString errorString() const override
	{
		return process.errorString();
	}

	bool waitForOutput(int msecs) override;
	QByteArray readStandardOutput() override;
	QByteArray readStandardError() override;
	bool isRunning() override;
	void interrupt() override;
	int waitForFinished() override;

private:
	Q_DISABLE_COPY(IsdbHelperProcess)

	QProcess process;
};

class IsdbHelperProcessFactory : public IsdbProcessFactory
{
public:
	IsdbHelperProcessFactory() { }
	~IsdbHelperProcessFactory() { }

	IsdbProcess *createProcess() override
	{
		return new IsdbHelperProcess();
	}
};

#endif /* ISDBPROCESS_H */
