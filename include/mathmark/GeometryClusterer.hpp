#ifndef MATHMARK_GEOMETRY_CLUSTERER_HPP
#define MATHMARK_GEOMETRY_CLUSTERER_HPP

#include "mathmark/PageModel.hpp"
#include "mathmark/PipelineConfig.hpp"

#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief A maximal group of primitives whose dilated boxes touch
 */
struct VectorCluster {
  int pageIndex = 0;          ///< 0-indexed page number
  BoundingBox bbox;           ///< Union of member boxes
  std::vector<int> members;   ///< Indices into Page::primitives, ascending

  int primitiveCount() const { return static_cast<int>(members.size()); }
  double aspectRatio() const {
    return bbox.height() > 0 ? bbox.width() / bbox.height() : 0.0;
  }
};

/**
 * @brief Why a cluster is not treated as a formula
 */
enum class RejectionReason {
  None,
  HeaderFooterZone,
  TooSmall,
  TooFewPrimitives,
  TooLarge,
  TableLike,
  RuleLike,
  BlankRegion
};

std::string toString(RejectionReason reason);

/**
 * @brief Groups a page's vector primitives and classifies the groups
 *
 * Example usage:
 * @code
 * mathmark::GeometryClusterer clusterer(config.cluster);
 * for (const auto &cluster : clusterer.clusterPage(page)) {
 *     if (clusterer.classify(cluster, page) == RejectionReason::None) {
 *         // formula candidate
 *     }
 * }
 * @endcode
 */
class GeometryClusterer {
public:
  GeometryClusterer();
  explicit GeometryClusterer(const ClusterConfig &config);

  /**
   * @brief Cluster the primitives of one page
   *
   * Primitives are merged with union-find when their boxes, dilated by the
   * proximity margin, intersect. Merging is repeated over the cluster boxes
   * until no two clusters intersect, so the result is spatially disjoint.
   * Background primitives (covering nearly the whole page) are skipped.
   *
   * @param page Page with its primitives
   * @return Clusters in reading order (rows top to bottom, left to right)
   */
  std::vector<VectorCluster> clusterPage(const Page &page) const;

  /**
   * @brief Decide whether a cluster looks like a formula
   * @return RejectionReason::None for formula-like clusters
   */
  RejectionReason classify(const VectorCluster &cluster,
                           const Page &page) const;

  bool isFormulaLike(const VectorCluster &cluster, const Page &page) const {
    return classify(cluster, page) == RejectionReason::None;
  }

  /// Proximity margin applied on each side, in points
  double marginX(const Page &page) const;
  double marginY(const Page &page) const;

  const ClusterConfig &getConfig() const { return m_config; }

  /**
   * @brief Sort clusters into reading order
   *
   * Clusters are bucketed into rows whose top edges lie within the row
   * tolerance of the row's first cluster; rows run top to bottom and
   * clusters within a row left to right.
   */
  static void sortReadingOrder(std::vector<VectorCluster> &clusters,
                               double rowTolerance);

private:
  bool isTableLike(const VectorCluster &cluster, const Page &page) const;
  bool isRuleLike(const VectorCluster &cluster, const Page &page) const;

  ClusterConfig m_config;
};

} // namespace mathmark

#endif // MATHMARK_GEOMETRY_CLUSTERER_HPP
