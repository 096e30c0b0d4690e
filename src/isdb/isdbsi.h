/*
 * isdbsi.h
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

#ifndef ISDBSI_H
#define ISDBSI_H

#include <QList>
#include <QMap>
#include <QSharedPointer>
#include <QString>

class QTextCodec;

/*
 * decoded descriptors; the core only ever sees these, never raw section bytes
 */

class IsdbDescriptorBase
{
public:
	enum DescriptorType
	{
		NetworkName		= 0x40,
		SatelliteDeliverySystem	= 0x43,
		Service			= 0x48,
		TsInformation		= 0xcd,
		PartialReception	= 0xfb
	};

	virtual ~IsdbDescriptorBase() { }

protected:
	IsdbDescriptorBase() { }
};

class IsdbNetworkNameDescriptor : public IsdbDescriptorBase
{
public:
	QString networkName;
};

class IsdbSatelliteDeliverySystemDescriptor : public IsdbDescriptorBase
{
public:
	IsdbSatelliteDeliverySystemDescriptor() : frequency(0), orbitalPosition(0),
		westEastFlag(false), polarization(0), symbolRate(0) { }

	double frequency; // GHz
	int orbitalPosition; // 0.1 degree
	bool westEastFlag;
	int polarization;
	int symbolRate; // kSym/s
};

class IsdbServiceDescriptor : public IsdbDescriptorBase
{
public:
	IsdbServiceDescriptor() : serviceType(-1) { }

	int serviceType;
	QString providerName;
	QString serviceName;
};

class IsdbTsInformationDescriptor : public IsdbDescriptorBase
{
public:
	IsdbTsInformationDescriptor() : remoteControlKeyId(-1) { }

	int remoteControlKeyId;
	QString tsName;
};

class IsdbPartialReceptionDescriptor : public IsdbDescriptorBase
{
public:
	QList<int> serviceIds;
};

/*
 * tagged variant over the descriptor kinds above
 */

class IsdbDescriptor
{
public:
	template<class T> explicit IsdbDescriptor(const T &descriptor) :
		descriptorType(descriptorTypeFor(&descriptor)), data(new T(descriptor)) { }
	~IsdbDescriptor() { }

	IsdbDescriptorBase::DescriptorType getDescriptorType() const
	{
		return descriptorType;
	}

	template<class T> const T *as() const
	{
		if (descriptorType == descriptorTypeFor(static_cast<const T *>(NULL))) {
			return static_cast<const T *>(data.data());
		}

		return NULL;
	}

private:
	static IsdbDescriptorBase::DescriptorType descriptorTypeFor(const IsdbNetworkNameDescriptor *)
	{
		return IsdbDescriptorBase::NetworkName;
	}

	static IsdbDescriptorBase::DescriptorType descriptorTypeFor(
		const IsdbSatelliteDeliverySystemDescriptor *)
	{
		return IsdbDescriptorBase::SatelliteDeliverySystem;
	}

	static IsdbDescriptorBase::DescriptorType descriptorTypeFor(const IsdbServiceDescriptor *)
	{
		return IsdbDescriptorBase::Service;
	}

	static IsdbDescriptorBase::DescriptorType descriptorTypeFor(const IsdbTsInformationDescriptor *)
	{
		return IsdbDescriptorBase::TsInformation;
	}

	static IsdbDescriptorBase::DescriptorType descriptorTypeFor(
		const IsdbPartialReceptionDescriptor *)
	{
		return IsdbDescriptorBase::PartialReception;
	}

	IsdbDescriptorBase::DescriptorType descriptorType;
	QSharedPointer<const IsdbDescriptorBase> data;
};

// descriptor tag -> descriptors with that tag, in stream order
class IsdbDescriptorMap
{
public:
	IsdbDescriptorMap() { }
	~IsdbDescriptorMap() { }

	void append(const IsdbDescriptor &descriptor)
	{
		descriptors[descriptor.getDescriptorType()].append(descriptor);
	}

	QList<IsdbDescriptor> list(IsdbDescriptorBase::DescriptorType type) const
	{
		return descriptors.value(type);
	}

	bool isEmpty() const
	{
		return descriptors.isEmpty();
	}

private:
	QMap<int, QList<IsdbDescriptor> > descriptors;
};

/*
 * NIT (actual network) and SDT (actual transport stream) records
 */

class IsdbNitEntry
{
public:
	IsdbNitEntry() : transportStreamId(-1), originalNetworkId(-1) { }
	~IsdbNitEntry() { }

	int transportStreamId;
	int originalNetworkId;
	IsdbDescriptorMap descriptors;
};

class IsdbNitRecord
{
public:
	IsdbNitRecord() : networkId(-1) { }
	~IsdbNitRecord() { }

	int networkId;
	IsdbDescriptorMap networkDescriptors;
	QList<IsdbNitEntry> transportStreams;
};

class IsdbSdtEntry
{
public:
	IsdbSdtEntry() : serviceId(-1), freeCaMode(false) { }
	~IsdbSdtEntry() { }

	int serviceId;
	bool freeCaMode; // set if the service is scrambled
	IsdbDescriptorMap descriptors;
};

class IsdbSdtRecord
{
public:
	IsdbSdtRecord() : transportStreamId(-1), originalNetworkId(-1) { }
	~IsdbSdtRecord() { }

	int transportStreamId;
	int originalNetworkId;
	QList<IsdbSdtEntry> services;
};

class IsdbSiRecords
{
public:
	QList<IsdbNitRecord> nitRecords;
	QList<IsdbSdtRecord> sdtRecords;
};

class IsdbSiText
{
public:
	// ARIB STD-B24 8-unit code
	static QString convertText(const char *data, int size);

	/*
	 * full-width latin to half-width, except for ! ? * ~ @ which are kept
	 * full-width; U+301C becomes U+FF5E
	 */
	static QString normalize(const QString &text);

private:
	static QTextCodec *eucJpCodec();
};

#endif /* ISDBSI_H */
