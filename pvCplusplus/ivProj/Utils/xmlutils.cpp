#include "xmlutils.h"
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/algorithm/string/trim.hpp>

GetSimOptFile* GetSimOptFile::m_pInstance = NULL;

/**
 * Read the element 'name' of the node and check lo <= value <= hi.
 * An absent element keeps the current value.
 */
template<class T>
static void readBounded(const ptree& node, const std::string& section, const std::string& name,
	T lo, T hi, T& val)
{
	boost::optional<std::string> str = node.get_optional<std::string>(name);
	if (!str)
		return;

	T parsed;
	try {
		parsed = boost::lexical_cast<T>(boost::algorithm::trim_copy(*str));
	} catch (const boost::bad_lexical_cast&) {
		THROWCFGERROR(", " + section + "." + name + " is not a number: '" + *str + "'");
	}
	if (!(parsed >= lo && parsed <= hi))
		THROWCFGERROR(", " + section + "." + name + " = " + *str + " is out of range ["
			+ boost::lexical_cast<std::string>(lo) + ", " + boost::lexical_cast<std::string>(hi) + "]");
	val = parsed;
}

GetSimOptFile* GetSimOptFile::Instance()
{
	if (!m_pInstance)
		m_pInstance = new GetSimOptFile;

	return m_pInstance;
}

void GetSimOptFile::resetDefaults()
{
	User = SolverOpt();

	/// ELGIN ELG590-M72HEP.
	module = { 52.0, 14.31, 43.55, 13.55, 2.648, 144, 0.046/100.0, -0.26/100.0 };
	diode  = { 1.3, 0.2, 1000.0 };
	cond   = { GREF, TREF };
	resolution = DEFRESOLUTION;
}

void GetSimOptFile::openOptionFile(std::string optFile_)
{
	try {
		boost::property_tree::read_xml(optFile_, pt);
	} catch (const boost::property_tree::xml_parser_error& e) {
		THROWCFGERROR(", cannot read the option file " + optFile_ + ": " + e.message());
	}
	fileName = optFile_;
}

void GetSimOptFile::readPrecTol(const ptree& node)
{
	readBounded<unsigned>(node, "PrecTol", "MaxIter", 1u, 100000u, User.MaxIter);
	readBounded<double>(node, "PrecTol", "StepTol", EPSILON0, 1.0, User.StepTol);
	readBounded<double>(node, "PrecTol", "ExpArgLim", 1.0, 700.0, User.ExpArgLim);
	readBounded<double>(node, "PrecTol", "NegSlack", 0.0, Inf, User.NegSlack);
	readBounded<double>(node, "PrecTol", "CapFactor", 1.0, Inf, User.CapFactor);
}

void GetSimOptFile::readModule(const ptree& node)
{
	readBounded<double>(node, "Module", "Voc", EPSILON0, Inf, module.vocRef);
	readBounded<double>(node, "Module", "Isc", EPSILON0, Inf, module.iscRef);
	readBounded<double>(node, "Module", "Vmpp", EPSILON0, Inf, module.vmppRef);
	readBounded<double>(node, "Module", "Impp", EPSILON0, Inf, module.imppRef);
	readBounded<double>(node, "Module", "Area", EPSILON0, Inf, module.area);
	readBounded<int>(node, "Module", "CellsSeries", 1, 100000, module.cellsSeries);

	/// Datasheets quote the thermal coefficients in %/degC.
	double alphaPct = module.alphaIsc*100.0;
	double betaPct  = module.betaVoc*100.0;
	readBounded<double>(node, "Module", "AlphaIscPct", 0.0, 100.0, alphaPct);
	readBounded<double>(node, "Module", "BetaVocPct", -100.0, 0.0, betaPct);
	module.alphaIsc = alphaPct/100.0;
	module.betaVoc  = betaPct/100.0;
}

void GetSimOptFile::readDiodeModel(const ptree& node)
{
	readBounded<double>(node, "DiodeModel", "n", std::nextafter(1.0, 2.0), std::nextafter(2.0, 1.0), diode.n);
	readBounded<double>(node, "DiodeModel", "Rs", 0.0, Inf, diode.Rs);
	readBounded<double>(node, "DiodeModel", "Rsh", EPSILON0, Inf, diode.Rsh);
	readBounded<int>(node, "DiodeModel", "Resolution", 50, 400, resolution);
}

void GetSimOptFile::readCondition(const ptree& node)
{
	readBounded<double>(node, "Condition", "Irradiance", EPSILON0, Inf, cond.G);
	readBounded<double>(node, "Condition", "Temperature", -TKELVIN0, Inf, cond.Tc);
}

void GetSimOptFile::readOptionFile()
{
	resetDefaults();

	boost::optional<ptree&> root = pt.get_child_optional("SimOption");
	if (!root)
		THROWCFGERROR(", missing root element 'SimOption' in " + fileName);

	BOOST_FOREACH(ptree::value_type const& node, *root)
	{
		if (node.first == "PrecTol")
			readPrecTol(node.second);
		else if (node.first == "Module")
			readModule(node.second);
		else if (node.first == "DiodeModel")
			readDiodeModel(node.second);
		else if (node.first == "Condition")
			readCondition(node.second);
		else if (node.first != "<xmlcomment>")
			std::cerr << "Warning: GetSimOptFile, ignoring unknown section '" << node.first << "'\n";
	}

#ifndef NDEBUG
	std::cout << "MaxIter, StepTol and ExpArgLim are "
		<< User.MaxIter << ", " << User.StepTol << ", " << User.ExpArgLim << std::endl;
	std::cout << "n, Rs and Rsh are "
		<< diode.n << ", " << diode.Rs << ", " << diode.Rsh << std::endl;
#endif
}
