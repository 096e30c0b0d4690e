/*
 * isdbtuner.h
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

#ifndef ISDBTUNER_H
#define ISDBTUNER_H

#include <QByteArray>
#include <QString>

class IsdbProcess;
class IsdbProcessFactory;

/*
 * the tuning timeout only runs until the first byte of the stream arrives
 */

class IsdbTuningTimer
{
public:
	enum State
	{
		AwaitingFirstByte,
		Streaming,
		TimedOut
	};

	explicit IsdbTuningTimer(double timeout_) : state(AwaitingFirstByte), elapsed(0),
		timeout(timeout_) { }
	~IsdbTuningTimer() { }

	// advances the clock by the given number of seconds
	State update(bool dataReceived, double seconds);

	State getState() const
	{
		return state;
	}

	double getElapsed() const
	{
		return elapsed;
	}

private:
	State state;
	double elapsed;
	double timeout;
};

// reports the signal level of a channel until stopped
class IsdbSignalLevelReader
{
public:
	explicit IsdbSignalLevelReader(IsdbProcess *process_) : process(process_), stopped(false) { }
	~IsdbSignalLevelReader();

	// returns false once the helper process has exited
	bool next(double *level);

	// interrupts the helper process and waits for it
	void stop();

private:
	Q_DISABLE_COPY(IsdbSignalLevelReader)

	bool readLine(QByteArray *line);

	IsdbProcess *process;
	bool stopped;
	QByteArray pending;
};

class IsdbTuner
{
public:
	enum DeviceType
	{
		ChardevDevice,
		V4lDvbDevice
	};

	enum TunerType
	{
		IsdbT,
		IsdbS,
		IsdbTS // multi tuner
	};

	enum TuneError
	{
		NoError,
		OpeningError,
		TuningError,
		TuningTimeout,
		OutputTooSmall
	};

	IsdbTuner(const QString &devicePath_, DeviceType deviceType_, TunerType type_,
		const QString &name_, IsdbProcessFactory *processFactory_);
	~IsdbTuner();

	QString getDevicePath() const
	{
		return devicePath;
	}

	DeviceType getDeviceType() const
	{
		return deviceType;
	}

	TunerType getType() const
	{
		return type;
	}

	QString getName() const
	{
		return name;
	}

	bool supportsTerrestrial() const
	{
		return (type != IsdbS);
	}

	bool supportsSatellite() const
	{
		return (type != IsdbT);
	}

	// set by capture() if the device could not be opened
	bool lastOpeningFailed() const
	{
		return openingFailed;
	}

	void setRecisdbPath(const QString &recisdbPath_)
	{
		recisdbPath = recisdbPath_;
	}

	void setOutputRecisdbLog(bool outputRecisdbLog_)
	{
		outputRecisdbLog = outputRecisdbLog_;
	}

	void setMinimumOutputSize(int minimumOutputSize_)
	{
		minimumOutputSize = minimumOutputSize_;
	}

	/*
	 * records the channel for recordingTime seconds; recordingTime does not
	 * include the time needed to open the tuner
	 */
	TuneError capture(const QString &physicalChannel, int recordingTime, double tuneTimeout,
		QByteArray *data, QString *errorString);

	// returns NULL if the helper can not be started; the caller owns the reader
	IsdbSignalLevelReader *startSignalLevel(const QString &physicalChannel);

	// mean of five readings; false if the helper exits before
	bool getSignalLevelMean(const QString &physicalChannel, double *mean);

	// "T13" -> "T13", "BS01/TS0" -> "BS01_0", "ND02" -> "CS02"
	static QString toRecisdbChannel(const QString &physicalChannel);

	static TuneError classifyError(const QByteArray &standardError, QString *errorString);

	static QString tunerTypeName(TunerType type);

private:
	Q_DISABLE_COPY(IsdbTuner)

	QString devicePath;
	DeviceType deviceType;
	TunerType type;
	QString name;
	IsdbProcessFactory *processFactory;

	QString recisdbPath;
	bool outputRecisdbLog;
	int minimumOutputSize;
	bool openingFailed;
};

#endif /* ISDBTUNER_H */
