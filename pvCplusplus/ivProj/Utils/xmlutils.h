/**
 * Operations on the SimOption.xml file.
 *
 * Basic: open and read file, read and update its elements.
 * Further: validate every value against the range the model recognizes and
 * hand out the solver options, the module nameplate, the diode parameters and the
 * operating condition.
 */
#ifndef XMLUTILS_H_
#define XMLUTILS_H_

#include "pvcommutils.h"
#include <iostream>
#include <string>
#include <cstring>
#include <vector>

#include <boost/property_tree/xml_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/foreach.hpp>
using boost::property_tree::ptree;

/// Singleton class.
class GetSimOptFile
{
private:
	GetSimOptFile() { resetDefaults(); } /// Private.
	static GetSimOptFile* m_pInstance;

	std::string fileName;

	struct SolverOpt User; /// Defaults overridden by 'PrecTol'.

	ModuleSpec  module;
	DiodeParams diode;
	Condition   cond;
	int         resolution;

	ptree pt;

	void readPrecTol(const ptree& node);
	void readModule(const ptree& node);
	void readDiodeModel(const ptree& node);
	void readCondition(const ptree& node);

public:
	static GetSimOptFile* Instance();

	/// Restore the built-in defaults (ELG590-M72HEP module at STC).
	void resetDefaults();

	void openOptionFile(std::string optFile);
	void readOptionFile();
	const std::string& getFileName() const { return fileName; }

	template<class T>
	inline T getElement(std::string eleName_)
	{
		if (!strcmp(eleName_.c_str(), "MaxIter"))
			return static_cast<T>(User.MaxIter);
		else if (!strcmp(eleName_.c_str(), "StepTol"))
			return static_cast<T>(User.StepTol);
		else if (!strcmp(eleName_.c_str(), "ExpArgLim"))
			return static_cast<T>(User.ExpArgLim);
		else if (!strcmp(eleName_.c_str(), "NegSlack"))
			return static_cast<T>(User.NegSlack);
		else if (!strcmp(eleName_.c_str(), "CapFactor"))
			return static_cast<T>(User.CapFactor);
		else if (!strcmp(eleName_.c_str(), "Resolution"))
			return static_cast<T>(resolution);
		else if (!strcmp(eleName_.c_str(), "Irradiance"))
			return static_cast<T>(cond.G);
		else if (!strcmp(eleName_.c_str(), "Temperature"))
			return static_cast<T>(cond.Tc);
		THROWCFGERROR(std::string(", could not identify the element ") + eleName_);
	}

	template<class T>
	inline void setElement(std::string eleName_, T val)
	{
		if (!strcmp(eleName_.c_str(), "Irradiance"))
			cond.G = static_cast<double>(val);
		else if (!strcmp(eleName_.c_str(), "Temperature"))
			cond.Tc = static_cast<double>(val);
		else if (!strcmp(eleName_.c_str(), "Resolution"))
			resolution = static_cast<int>(val);
		else
			THROWCFGERROR(std::string(", could not identify the element ") + eleName_);
	}

	SolverOpt   getSolverOpt() const { return User; }
	ModuleSpec  getModuleSpec() const { return module; }
	DiodeParams getDiodeParams() const { return diode; }
	Condition   getCondition() const { return cond; }
	int         getResolution() const { return resolution; }

	/// Overwrite (n, Rs, Rsh), e.g. after a calibration was adopted.
	void setDiodeParams(const DiodeParams& dp) { diode = dp; }
};
#endif
