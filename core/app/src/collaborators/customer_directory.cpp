#include "lendflow/collaborators/customer_directory.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace lendflow {

namespace {

domain::CustomerRecord makeRecord(std::string id, std::string name,
                                  std::string phone, std::string pan,
                                  std::string city, int score, bool kyc,
                                  double salary, std::string employer,
                                  double limit, double rate, int tenure,
                                  std::string offer_type) {
  domain::CustomerRecord r;
  r.customer_id = std::move(id);
  r.name = std::move(name);
  r.phone = std::move(phone);
  r.pan_number = std::move(pan);
  r.city = std::move(city);
  r.credit_score = score;
  r.kyc_verified = kyc;
  r.monthly_salary = salary;
  r.employer = std::move(employer);
  r.offer = domain::PreapprovedOffer{limit, rate, tenure, std::move(offer_type)};
  return r;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CustomerDirectory::CustomerDirectory(
    const std::vector<domain::CustomerRecord>& records) {
  for (const auto& record : records) {
    add(record);
  }
}

// -----------------------------------------------------------------------------
// lookup(): phone first, then customer id
// -----------------------------------------------------------------------------
LookupResult CustomerDirectory::lookup(const std::string& phone_or_id) {
  std::shared_lock lock(mutex_);

  LookupResult result;
  auto it = by_phone_.find(normalizePhone(phone_or_id));
  if (it == by_phone_.end()) {
    auto id_it = phone_by_id_.find(phone_or_id);
    if (id_it != phone_by_id_.end()) {
      it = by_phone_.find(id_it->second);
    }
  }

  if (it == by_phone_.end()) {
    result.status = LookupStatus::NotFound;
    result.not_found_reason =
        "No customer record found for this phone number";
    return result;
  }

  result.status = LookupStatus::Found;
  result.customer = it->second;
  return result;
}

// -----------------------------------------------------------------------------
// add()
// -----------------------------------------------------------------------------
void CustomerDirectory::add(domain::CustomerRecord record) {
  std::string phone = normalizePhone(record.phone);
  if (phone.empty()) {
    throw std::invalid_argument("customer " + record.customer_id +
                                " has no phone number");
  }
  record.phone = phone;

  std::unique_lock lock(mutex_);
  phone_by_id_[record.customer_id] = phone;
  by_phone_[phone] = std::move(record);
}

// -----------------------------------------------------------------------------
// size()
// -----------------------------------------------------------------------------
std::size_t CustomerDirectory::size() const {
  std::shared_lock lock(mutex_);
  return by_phone_.size();
}

// -----------------------------------------------------------------------------
// normalizePhone()
// -----------------------------------------------------------------------------
std::string CustomerDirectory::normalizePhone(const std::string& phone) {
  std::string digits;
  digits.reserve(phone.size());
  for (char c : phone) {
    if (c != ' ' && c != '-') {
      digits.push_back(c);
    }
  }
  if (digits.rfind("+91", 0) == 0) {
    digits.erase(0, 3);
  }
  if (digits.size() == 12 && digits.rfind("91", 0) == 0) {
    digits.erase(0, 2);
  }
  return digits;
}

// -----------------------------------------------------------------------------
// sampleBook()
// -----------------------------------------------------------------------------
std::vector<domain::CustomerRecord> CustomerDirectory::sampleBook() {
  std::vector<domain::CustomerRecord> book;
  book.push_back(makeRecord("CUST001", "Rahul Sharma", "9876543210",
                            "ABCDE1234F", "New Delhi", 780, true, 85000.0,
                            "TCS", 500000.0, 12.5, 60, "PREMIUM"));
  book.push_back(makeRecord("CUST002", "Priya Patel", "9876543211",
                            "FGHIJ5678K", "Mumbai", 820, true, 120000.0,
                            "Infosys", 750000.0, 11.0, 72, "SUPER_PREMIUM"));
  book.push_back(makeRecord("CUST003", "Amit Kumar", "9876543212",
                            "KLMNO9012P", "Bangalore", 750, true, 65000.0,
                            "Wipro", 300000.0, 13.5, 48, "STANDARD"));
  book.push_back(makeRecord("CUST004", "Vikram Singh", "9876543213",
                            "PQRST3456Q", "Pune", 650, true, 45000.0,
                            "Self-employed", 0.0, 18.0, 24, "NONE"));
  book.push_back(makeRecord("CUST005", "Sneha Reddy", "9876543214",
                            "UVWXY7890R", "Hyderabad", 760, false, 95000.0,
                            "Amazon", 400000.0, 12.0, 48, "STANDARD"));
  book.push_back(makeRecord("CUST006", "Arjun Das", "9876543215",
                            "DASAJ1234A", "Noida", 710, true, 35000.0,
                            "Swiggy", 200000.0, 14.5, 36, "BASIC"));
  book.push_back(makeRecord("CUST007", "Meera Iyer", "9876543216",
                            "IYERM5678B", "Chennai", 850, true, 250000.0,
                            "Google", 1000000.0, 10.5, 60, "PLATINUM"));
  book.push_back(makeRecord("CUST008", "Zainab Khan", "9876543217",
                            "KHANZ9012C", "Lucknow", 690, true, 40000.0,
                            "Freelance", 0.0, 18.0, 24, "NONE"));
  book.push_back(makeRecord("CUST009", "Chris D'Souza", "9876543218",
                            "DSOUC3456D", "Mumbai", 740, true, 70000.0,
                            "StartUp Inc", 450000.0, 13.0, 48, "STANDARD"));
  book.push_back(makeRecord("CUST010", "Pooja Hegde", "9876543219",
                            "HEGDP7890E", "Bangalore", 790, true, 90000.0,
                            "HDFC Bank", 600000.0, 12.0, 60, "PREMIUM"));
  return book;
}

// -----------------------------------------------------------------------------
// loadFile()
// -----------------------------------------------------------------------------
std::vector<domain::CustomerRecord> CustomerDirectory::loadFile(
    const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open customer file: " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Invalid JSON in customer file " + path + ": " +
                             e.what());
  }

  auto records = parseRecords(doc);
  std::cout << "[CustomerDirectory] loaded " << records.size()
            << " customer(s) from " << path << "\n";
  return records;
}

// -----------------------------------------------------------------------------
// parseRecords()
// -----------------------------------------------------------------------------
std::vector<domain::CustomerRecord> CustomerDirectory::parseRecords(
    const nlohmann::json& doc) {
  if (!doc.is_array()) {
    throw std::runtime_error("Customer book must be a JSON array");
  }

  std::vector<domain::CustomerRecord> records;
  records.reserve(doc.size());

  for (const auto& item : doc) {
    try {
      domain::CustomerRecord r;
      r.customer_id = item.at("customer_id").get<std::string>();
      r.name = item.at("name").get<std::string>();
      r.phone = item.at("phone").get<std::string>();
      r.pan_number = item.value("pan_number", std::string{});
      r.city = item.value("city", std::string{});
      r.credit_score = item.at("credit_score").get<int>();
      r.kyc_verified = item.value("kyc_verified", false);
      r.monthly_salary = item.value("monthly_salary", 0.0);
      r.employer = item.value("employer", std::string{});

      auto offer_it = item.find("offer");
      if (offer_it != item.end() && !offer_it->is_null()) {
        domain::PreapprovedOffer offer;
        offer.limit = offer_it->at("limit").get<double>();
        offer.interest_rate = offer_it->at("interest_rate").get<double>();
        offer.max_tenure_months = offer_it->value("max_tenure_months", 0);
        offer.offer_type = offer_it->value("offer_type", std::string{"STANDARD"});
        r.offer = offer;
      }
      records.push_back(std::move(r));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Malformed customer record #" +
                               std::to_string(records.size()) + ": " +
                               e.what());
    }
  }
  return records;
}

}  // namespace lendflow
